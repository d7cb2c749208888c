#include "csa/parsers/parser.hpp"
#include "csa/ast/traversal.hpp"
#include "csa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace csa::parsers {

    ParseResult IParser::parse(
        const std::string_view source,
        const std::optional<std::string>& filename
    ) const {
        const auto start_time = std::chrono::steady_clock::now();

        ParseResult result = do_parse(source);
        if (!result.ast) {
            result.ast = std::make_unique<ast::Program>();
        }

        const auto elapsed = std::chrono::steady_clock::now() - start_time;

        result.metadata.language = std::string(language_id());
        result.metadata.parse_time_ms =
            std::chrono::duration<double, std::milli>(elapsed).count();
        result.metadata.node_count = ast::count_nodes(*result.ast);
        result.metadata.line_count = string_utils::split_lines(source).size();
        result.metadata.filename = filename;

        spdlog::debug("Parsed {} ({}): {} nodes, {} errors, {:.3f} ms",
                      filename.value_or("<string>"),
                      result.metadata.language,
                      result.metadata.node_count,
                      result.errors.size(),
                      result.metadata.parse_time_ms);

        return result;
    }

    bool IParser::can_parse(const std::string_view filename) const {
        const fs::path path{std::string(filename)};
        const std::string name = path.filename().string();

        const auto dot = name.rfind('.');
        if (dot == std::string::npos || dot + 1 >= name.size()) {
            return false;
        }

        const std::string extension = string_utils::to_lower(std::string_view(name).substr(dot + 1));
        return supported_extensions().contains(extension);
    }

}  // namespace csa::parsers
