#ifndef POST_MAKER_CURL_COMMAND_HPP
#define POST_MAKER_CURL_COMMAND_HPP

#include <string>
#include <string_view>

#include "../pipeline/model/model.hpp"

namespace cli {
    struct CurlFlags {
        static constexpr const char* REQUEST_SHORT = "-X";
        static constexpr const char* REQUEST_LONG = "--request";
        static constexpr const char* HEADER_SHORT = "-H";
        static constexpr const char* HEADER_LONG = "--header";
        static constexpr const char* DATA_SHORT = "-d";
        static constexpr const char* DATA_LONG = "--data";
        static constexpr const char* DATA_RAW = "--data-raw";
        static constexpr const char* DATA_BINARY = "--data-binary";
    };

    // Understands -X, -H and the -d family. Other flags are skipped; the last bare token is the URL.
    // Throws std::runtime_error when the text is not a curl command or names no URL.
    [[nodiscard]] pipeline::model::RequestDescriptor parse_curl_command(std::string_view text);

    // curl [-X METHOD] [-H 'K: V']... [-d BODY] URL, every token shell-quoted.
    [[nodiscard]] std::string to_curl_command(const pipeline::model::RequestDescriptor& descriptor);
}  // namespace cli

#endif
