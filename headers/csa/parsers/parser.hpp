#ifndef CODESTRUCTUREANALYZER_PARSER_HPP
#define CODESTRUCTUREANALYZER_PARSER_HPP

/**
 * @file parser.hpp
 * @brief Parser interface and registry.
 *
 * Defines the interface for language front-ends. Each language whose
 * source should be analyzed has a parser that turns text into the
 * canonical AST (see ast/node.hpp).
 *
 * Supported languages:
 * - Python: tree-sitter-python grammar
 */

#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/ast/node.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csa::parsers {

    namespace fs = std::filesystem;

    /**
     * A syntax error or warning found while parsing.
     *
     * Lines are 1-based, columns 0-based. @c text holds the offending
     * source line when it is available.
     */
    struct ParseDiagnostic {
        std::string kind;
        std::string message;
        std::size_t line = 0;
        std::size_t column = 0;
        std::optional<std::string> text;
    };

    struct ParseMetadata {
        std::string language;
        double parse_time_ms = 0.0;
        std::size_t node_count = 0;
        std::size_t line_count = 0;
        std::optional<std::string> filename;
    };

    /**
     * Output of a single parse call.
     *
     * The AST is owned exclusively by the result and is never shared with
     * any other parse. It is always present; after syntax errors it holds
     * whatever statements could be recovered.
     */
    struct ParseResult {
        std::unique_ptr<ast::Program> ast;
        std::vector<ParseDiagnostic> errors;
        std::vector<ParseDiagnostic> warnings;
        ParseMetadata metadata;

        [[nodiscard]] bool has_errors() const noexcept {
            return !errors.empty();
        }
    };

    struct ParserConfig {
        std::string source_type = "module";
        bool include_locations = true;
    };

    /**
     * Base interface for all language parsers.
     *
     * Implementations hold only configuration, so one instance can parse
     * many inputs, including concurrently.
     */
    class IParser {
    public:
        virtual ~IParser() = default;

        /**
         * Returns the language identifier (e.g., "python").
         */
        [[nodiscard]] virtual std::string_view language_id() const noexcept = 0;

        /**
         * Returns the file extensions this parser handles.
         *
         * @return Lowercase extensions without the dot (e.g., {"py"}).
         */
        [[nodiscard]] virtual std::set<std::string> supported_extensions() const = 0;

        /**
         * Parses source text.
         *
         * Syntax errors do not fail the call; they are reported in
         * ParseResult::errors next to a partial AST. Metadata (timing,
         * node and line counts) is filled in here for every parser.
         *
         * @param source The source text.
         * @param filename Optional name recorded in the metadata.
         */
        [[nodiscard]] ParseResult parse(
            std::string_view source,
            const std::optional<std::string>& filename = std::nullopt
        ) const;

        /**
         * Checks whether the extension of @p filename is supported.
         *
         * Only the final path component is considered; the extension is
         * the text after its last '.', compared case-insensitively. A name
         * without an extension never matches.
         */
        [[nodiscard]] bool can_parse(std::string_view filename) const;

    protected:
        /**
         * Builds the AST and diagnostics. Metadata is left to parse().
         */
        [[nodiscard]] virtual ParseResult do_parse(std::string_view source) const = 0;
    };

    /**
     * Maps language identifiers to parsers.
     *
     * A registry is an ordinary object: create as many as needed, each one
     * independent. Registration order is significant for filename lookup.
     * Mutation is not synchronized; hosts that register from several
     * threads must serialize it themselves.
     */
    class ParserRegistry {
    public:
        ParserRegistry() = default;

        /**
         * Registers a parser under a language id.
         *
         * The id is lowercased. Registering an id again replaces the
         * earlier parser but keeps its position in the registration order.
         *
         * @param language_id Language identifier.
         * @param parser The parser; a null parser is ignored.
         */
        void register_parser(std::string_view language_id, std::shared_ptr<IParser> parser);

        /**
         * Removes a registration.
         *
         * @return True if the id was registered.
         */
        bool unregister_parser(std::string_view language_id);

        /**
         * Gets a parser by language id (case-insensitive).
         *
         * @return The parser, or nullptr.
         */
        [[nodiscard]] IParser* get_parser(std::string_view language_id) const;

        /**
         * Finds the first parser, in registration order, whose can_parse()
         * accepts @p filename.
         *
         * @return The parser, or nullptr.
         */
        [[nodiscard]] IParser* get_parser_by_filename(std::string_view filename) const;

        /**
         * Lists registered language ids in registration order.
         */
        [[nodiscard]] std::vector<std::string> registered_languages() const;

        [[nodiscard]] std::size_t size() const noexcept {
            return parsers_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return parsers_.empty();
        }

        /**
         * Parses source with the parser registered for @p language_id.
         *
         * @return The parse result, or ConfigError if no parser is
         *         registered for the id.
         */
        [[nodiscard]] Result<ParseResult, Error> parse(
            std::string_view code,
            std::string_view language_id,
            const std::optional<std::string>& filename = std::nullopt
        ) const;

        /**
         * Reads and parses a file, choosing the parser by its name.
         *
         * @return The parse result; ConfigError if no parser claims the
         *         file; the read error (NotFound, IoError) unchanged if the
         *         file cannot be read.
         */
        [[nodiscard]] Result<ParseResult, Error> parse_file(const fs::path& path) const;

    private:
        std::vector<std::pair<std::string, std::shared_ptr<IParser>>> parsers_;
    };

    /**
     * Registers the built-in parsers (Python) with @p registry.
     */
    void register_default_parsers(ParserRegistry& registry);

}  // namespace csa::parsers

#endif //CODESTRUCTUREANALYZER_PARSER_HPP
