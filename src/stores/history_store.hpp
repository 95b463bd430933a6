#ifndef POST_MAKER_HISTORY_STORE_HPP
#define POST_MAKER_HISTORY_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../pipeline/model/model.hpp"

namespace stores {
    class IHistoryStore {
       public:
        IHistoryStore() = default;
        virtual ~IHistoryStore() = default;
        IHistoryStore(const IHistoryStore&) = delete;
        IHistoryStore& operator=(const IHistoryStore&) = delete;
        IHistoryStore(IHistoryStore&&) = delete;
        IHistoryStore& operator=(IHistoryStore&&) = delete;

        virtual void append(const pipeline::model::ResponseRecord& record) = 0;
        [[nodiscard]] virtual std::vector<pipeline::model::ResponseRecord> load_all() const = 0;
        virtual void clear() = 0;
    };

    // Append-only JSON array of records, rewritten atomically on every append.
    // Every I/O or parse failure is raised as pipeline::error::HistoryIOError.
    class FileHistoryStore : public IHistoryStore {
       public:
        explicit FileHistoryStore(std::filesystem::path path);

        void append(const pipeline::model::ResponseRecord& record) override;
        [[nodiscard]] std::vector<pipeline::model::ResponseRecord> load_all() const override;
        void clear() override;

        [[nodiscard]] std::optional<pipeline::model::ResponseRecord> at(std::size_t index) const;
        [[nodiscard]] const std::filesystem::path& get_path() const { return path_; }

       private:
        [[nodiscard]] json::Array load_array() const;
        void store_array(json::Array entries);

        std::filesystem::path path_;
    };

    // Keeps records whose url or method contains search (case-insensitive), then the last last_n of those.
    [[nodiscard]] std::vector<pipeline::model::ResponseRecord> filter_history(std::vector<pipeline::model::ResponseRecord> records,
                                                                              const std::optional<std::string>& search,
                                                                              std::optional<std::size_t> last_n);
}  // namespace stores

#endif
