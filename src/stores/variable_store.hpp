#ifndef POST_MAKER_VARIABLE_STORE_HPP
#define POST_MAKER_VARIABLE_STORE_HPP

#include <filesystem>
#include <string>

#include "../pipeline/resolver/placeholder_resolver.hpp"

namespace stores {
    class IVariableStore {
       public:
        IVariableStore() = default;
        virtual ~IVariableStore() = default;
        IVariableStore(const IVariableStore&) = delete;
        IVariableStore& operator=(const IVariableStore&) = delete;
        IVariableStore(IVariableStore&&) = delete;
        IVariableStore& operator=(IVariableStore&&) = delete;

        [[nodiscard]] virtual pipeline::resolver::VariableMap load() const = 0;
        virtual void save(const pipeline::resolver::VariableMap& variables) = 0;
    };

    /**
     * Variables persisted as one JSON object. A missing, empty or unreadable file reads as an empty
     * map. Non-string values are kept as their compact JSON text.
     */
    class FileVariableStore : public IVariableStore {
       public:
        explicit FileVariableStore(std::filesystem::path path);

        [[nodiscard]] pipeline::resolver::VariableMap load() const override;
        void save(const pipeline::resolver::VariableMap& variables) override;

        void set(const std::string& name, const std::string& value);
        bool remove(const std::string& name);
        void clear();

        [[nodiscard]] const std::filesystem::path& get_path() const { return path_; }

       private:
        std::filesystem::path path_;
    };
}  // namespace stores

#endif
