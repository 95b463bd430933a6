#include "history_store.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "../pipeline/error/pipeline_error.hpp"
#include "../utils/string_utils.hpp"
#include "json_file.hpp"

namespace stores {
    FileHistoryStore::FileHistoryStore(std::filesystem::path path) : path_(std::move(path)) {}

    json::Array FileHistoryStore::load_array() const {
        std::optional<json::Value> doc;
        try {
            doc = read_json_file(path_);
        } catch (const std::runtime_error& e) {
            throw pipeline::error::HistoryIOError(path_.string(), e.what());
        }

        if (!doc) {
            return {};
        }
        if (!doc->is_array()) {
            throw pipeline::error::HistoryIOError(path_.string(), "expected a JSON array");
        }
        return doc->as_array();
    }

    void FileHistoryStore::store_array(json::Array entries) {
        try {
            write_json_file(path_, json::Value(std::move(entries)));
        } catch (const std::runtime_error& e) {
            throw pipeline::error::HistoryIOError(path_.string(), e.what());
        }
    }

    void FileHistoryStore::append(const pipeline::model::ResponseRecord& record) {
        json::Array entries = load_array();
        entries.push_back(pipeline::model::to_json(record));
        store_array(std::move(entries));
    }

    std::vector<pipeline::model::ResponseRecord> FileHistoryStore::load_all() const {
        const json::Array entries = load_array();

        std::vector<pipeline::model::ResponseRecord> out;
        out.reserve(entries.size());
        try {
            for (const auto& entry : entries) {
                out.push_back(pipeline::model::record_from_json(entry));
            }
        } catch (const std::runtime_error& e) {
            throw pipeline::error::HistoryIOError(path_.string(), e.what());
        }
        return out;
    }

    void FileHistoryStore::clear() { store_array({}); }

    std::optional<pipeline::model::ResponseRecord> FileHistoryStore::at(std::size_t index) const {
        auto records = load_all();
        if (index >= records.size()) {
            return std::nullopt;
        }
        return std::move(records[index]);
    }

    std::vector<pipeline::model::ResponseRecord> filter_history(std::vector<pipeline::model::ResponseRecord> records,
                                                                const std::optional<std::string>& search,
                                                                std::optional<std::size_t> last_n) {
        if (search && !search->empty()) {
            std::erase_if(records, [&](const pipeline::model::ResponseRecord& r) {
                return !string_utils::icontains(r.url_, *search) && !string_utils::icontains(r.method_, *search);
            });
        }

        if (last_n && *last_n > 0 && *last_n < records.size()) {
            records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(*last_n));
        }

        return records;
    }
}  // namespace stores
