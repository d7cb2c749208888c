#include "csa/analyzers/analyzer.hpp"
#include "csa/utils/file_utils.hpp"
#include "csa/utils/string_utils.hpp"

#include <algorithm>
#include <ranges>

namespace csa::analyzers {

    namespace {

        nlohmann::json optional_to_json(const std::optional<std::string>& value) {
            if (value) {
                return *value;
            }
            return nullptr;
        }

        nlohmann::json function_to_json(const FunctionInfo& function) {
            return {
                {"name", function.name},
                {"args", function.args},
                {"returns", optional_to_json(function.returns)},
                {"docstring", optional_to_json(function.docstring)},
                {"line_start", function.line_start},
                {"line_end", function.line_end},
                {"complexity", function.complexity},
                {"calls", function.calls},
                {"decorators", function.decorators}
            };
        }

        nlohmann::json class_to_json(const ClassInfo& cls) {
            nlohmann::json methods = nlohmann::json::array();
            for (const auto& method : cls.methods) {
                methods.push_back(method.name);
            }

            return {
                {"name", cls.name},
                {"bases", cls.bases},
                {"methods", methods},
                {"docstring", optional_to_json(cls.docstring)},
                {"line_start", cls.line_start},
                {"line_end", cls.line_end},
                {"decorators", cls.decorators}
            };
        }

        nlohmann::json import_to_json(const ImportInfo& import) {
            return {
                {"module", import.module},
                {"names", import.names},
                {"alias", optional_to_json(import.alias)},
                {"line", import.line}
            };
        }

        nlohmann::json statistics_to_json(const ModuleStatistics& stats) {
            return {
                {"total_lines", stats.total_lines},
                {"non_empty_lines", stats.non_empty_lines},
                {"num_functions", stats.num_functions},
                {"num_classes", stats.num_classes},
                {"num_imports", stats.num_imports},
                {"num_globals", stats.num_globals},
                {"avg_complexity", stats.avg_complexity},
                {"max_complexity", stats.max_complexity},
                {"functions_without_docstrings", stats.functions_without_docstrings}
            };
        }

    }  // namespace

    std::vector<const FunctionInfo*> ModuleAnalysis::all_functions() const {
        std::vector<const FunctionInfo*> result;
        result.reserve(functions.size());

        for (const auto& function : functions) {
            result.push_back(&function);
        }
        for (const auto& cls : classes) {
            for (const auto& method : cls.methods) {
                result.push_back(&method);
            }
        }

        return result;
    }

    const FunctionInfo* ModuleAnalysis::find_function(const std::string_view name) const {
        for (const auto* function : all_functions()) {
            if (function->name == name) {
                return function;
            }
        }
        return nullptr;
    }

    const ClassInfo* ModuleAnalysis::find_class(const std::string_view name) const {
        const auto it = std::ranges::find(classes, name, &ClassInfo::name);
        return it != classes.end() ? &*it : nullptr;
    }

    std::map<std::string, std::set<std::string>> ModuleAnalysis::get_dependencies() const {
        std::map<std::string, std::set<std::string>> dependencies;
        for (const auto* function : all_functions()) {
            dependencies[function->name] = function->calls;
        }
        return dependencies;
    }

    std::vector<std::string> ModuleAnalysis::find_unused_imports() const {
        std::vector<std::string> unused;

        for (const auto& import : imports) {
            if (!import.is_from) {
                const std::string& bound = import.bound_names.empty() ? import.module : import.bound_names.front();
                if (used_names.contains(bound)) {
                    continue;
                }
                unused.push_back(import.alias ? import.module + " as " + *import.alias : import.module);
                continue;
            }

            for (std::size_t i = 0; i < import.names.size(); ++i) {
                const std::string& name = import.names[i];
                if (name == "*") {
                    continue;
                }

                const std::string& bound = i < import.bound_names.size() ? import.bound_names[i] : name;
                if (used_names.contains(bound)) {
                    continue;
                }

                if (import.module.empty()) {
                    unused.push_back(name);
                } else if (string_utils::ends_with(import.module, ".")) {
                    unused.push_back(import.module + name);
                } else {
                    unused.push_back(import.module + "." + name);
                }
            }
        }

        return unused;
    }

    std::vector<const FunctionInfo*> ModuleAnalysis::find_long_functions(const std::size_t threshold) const {
        std::vector<const FunctionInfo*> result;
        for (const auto* function : all_functions()) {
            if (function->length() > threshold) {
                result.push_back(function);
            }
        }

        std::ranges::stable_sort(result, std::ranges::greater{}, [](const FunctionInfo* function) {
            return function->length();
        });
        return result;
    }

    std::vector<const FunctionInfo*> ModuleAnalysis::find_functions_without_docstrings() const {
        std::vector<const FunctionInfo*> result;
        for (const auto* function : all_functions()) {
            if (!function->docstring || function->docstring->empty()) {
                result.push_back(function);
            }
        }
        return result;
    }

    std::vector<std::pair<std::string, std::size_t>> ModuleAnalysis::get_complexity_report() const {
        std::vector<std::pair<std::string, std::size_t>> report;
        for (const auto* function : all_functions()) {
            report.emplace_back(function->name, function->complexity);
        }

        std::ranges::stable_sort(report, std::ranges::greater{}, &std::pair<std::string, std::size_t>::second);
        return report;
    }

    ModuleStatistics ModuleAnalysis::get_statistics() const {
        const auto all = all_functions();

        ModuleStatistics stats;
        stats.total_lines = total_lines;
        stats.non_empty_lines = non_empty_lines;
        stats.num_functions = all.size();
        stats.num_classes = classes.size();
        stats.num_imports = imports.size();
        stats.num_globals = globals.size();
        stats.functions_without_docstrings = find_functions_without_docstrings().size();

        if (!all.empty()) {
            std::size_t sum = 0;
            for (const auto* function : all) {
                sum += function->complexity;
                stats.max_complexity = std::max(stats.max_complexity, function->complexity);
            }
            stats.avg_complexity = static_cast<double>(sum) / static_cast<double>(all.size());
        }

        return stats;
    }

    nlohmann::json ModuleAnalysis::to_json() const {
        nlohmann::json functions_json = nlohmann::json::array();
        for (const auto* function : all_functions()) {
            functions_json.push_back(function_to_json(*function));
        }

        nlohmann::json classes_json = nlohmann::json::array();
        for (const auto& cls : classes) {
            classes_json.push_back(class_to_json(cls));
        }

        nlohmann::json imports_json = nlohmann::json::array();
        for (const auto& import : imports) {
            imports_json.push_back(import_to_json(import));
        }

        return {
            {"functions", functions_json},
            {"classes", classes_json},
            {"imports", imports_json},
            {"statistics", statistics_to_json(get_statistics())}
        };
    }

    Result<ModuleAnalysis, Error> ILanguageAnalyzer::analyze_file(const fs::path& path) const {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<ModuleAnalysis, Error>::failure(content.error());
        }
        return analyze(content.value(), path.string());
    }

    std::pair<std::size_t, std::size_t> count_lines(const std::string_view source, const std::string_view comment) {
        const auto lines = string_utils::split(source, '\n');

        std::size_t non_empty = 0;
        for (const auto line : lines) {
            const auto content = string_utils::trim(line);
            if (!content.empty() && !string_utils::starts_with(content, comment)) {
                ++non_empty;
            }
        }

        return {lines.size(), non_empty};
    }

}  // namespace csa::analyzers
