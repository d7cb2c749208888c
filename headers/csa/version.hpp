#ifndef CODESTRUCTUREANALYZER_VERSION_HPP
#define CODESTRUCTUREANALYZER_VERSION_HPP

/**
 * @file version.hpp
 * @brief Code Structure Analyzer version information.
 */

namespace csa {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Code Structure Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "csa";

}  // namespace csa

#endif //CODESTRUCTUREANALYZER_VERSION_HPP
