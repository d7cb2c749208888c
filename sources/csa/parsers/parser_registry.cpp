#include "csa/parsers/parser.hpp"
#include "csa/parsers/python_parser.hpp"
#include "csa/utils/file_utils.hpp"
#include "csa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ranges>

namespace csa::parsers {

    void ParserRegistry::register_parser(const std::string_view language_id, std::shared_ptr<IParser> parser) {
        if (!parser) {
            spdlog::warn("Ignoring null parser registration for '{}'", language_id);
            return;
        }

        std::string key = string_utils::to_lower(language_id);

        const auto it = std::ranges::find_if(parsers_, [&](const auto& entry) {
            return entry.first == key;
        });

        if (it != parsers_.end()) {
            spdlog::debug("Replacing parser for '{}'", key);
            it->second = std::move(parser);
            return;
        }

        spdlog::debug("Registered parser for '{}'", key);
        parsers_.emplace_back(std::move(key), std::move(parser));
    }

    bool ParserRegistry::unregister_parser(const std::string_view language_id) {
        const std::string key = string_utils::to_lower(language_id);
        return std::erase_if(parsers_, [&](const auto& entry) {
            return entry.first == key;
        }) > 0;
    }

    IParser* ParserRegistry::get_parser(const std::string_view language_id) const {
        const std::string key = string_utils::to_lower(language_id);
        for (const auto& [id, parser] : parsers_) {
            if (id == key) {
                return parser.get();
            }
        }
        return nullptr;
    }

    IParser* ParserRegistry::get_parser_by_filename(const std::string_view filename) const {
        for (const auto& parser : parsers_ | std::views::values) {
            if (parser->can_parse(filename)) {
                return parser.get();
            }
        }
        return nullptr;
    }

    std::vector<std::string> ParserRegistry::registered_languages() const {
        std::vector<std::string> result;
        result.reserve(parsers_.size());

        for (const auto& id : parsers_ | std::views::keys) {
            result.push_back(id);
        }

        return result;
    }

    Result<ParseResult, Error> ParserRegistry::parse(
        const std::string_view code,
        const std::string_view language_id,
        const std::optional<std::string>& filename
    ) const {
        const auto* parser = get_parser(language_id);
        if (!parser) {
            return Result<ParseResult, Error>::failure(
                Error::config_error("No parser registered for language", std::string(language_id))
            );
        }

        return Result<ParseResult, Error>::success(parser->parse(code, filename));
    }

    Result<ParseResult, Error> ParserRegistry::parse_file(const fs::path& path) const {
        const auto* parser = get_parser_by_filename(path.string());
        if (!parser) {
            return Result<ParseResult, Error>::failure(
                Error::config_error("No parser found for file", path.string())
            );
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<ParseResult, Error>::failure(content.error());
        }

        return Result<ParseResult, Error>::success(parser->parse(content.value(), path.string()));
    }

    void register_default_parsers(ParserRegistry& registry) {
        registry.register_parser("python", std::make_shared<PythonParser>());
    }

}  // namespace csa::parsers
