// =================================================================
// include/RepoLens/Language.hpp
// =================================================================
// Language tags assigned to scanned files and their reference families.

#pragma once

#include <string>
#include <vector>

namespace RepoLens {

/**
 * @brief Language tag carried by every indexed file
 *
 * Tags are assigned by the scanner from the file extension. Anything the
 * analyzer has no extractor for is tagged Other.
 */
enum class Language {
    TypeScript,
    TypeScriptReact,
    JavaScript,
    JavaScriptReact,
    Python,
    Java,
    Go,
    C,
    CHeader,
    Cpp,
    CppHeader,
    Rust,
    Swift,
    Other
};

/**
 * @brief Reference syntax shared by one or more languages
 *
 * Each family owns exactly one extractor/resolver strategy.
 */
enum class LanguageFamily {
    JavaScript,
    Python,
    Java,
    Go,
    CFamily,
    Rust,
    Swift,
    Unsupported
};

/**
 * @brief Display name of a language tag (e.g. "TypeScript React")
 */
std::string languageName(Language language);

/**
 * @brief Parse a display name back into a tag
 * @param name Display name, short alias ("TSX", "C++") accepted
 * @return Matching tag, or Language::Other when unknown
 */
Language languageFromName(const std::string& name);

/**
 * @brief Detect the language of a file from its extension
 * @param path File path or name
 * @return Detected tag, Language::Other if the extension is not recognised
 */
Language detectLanguage(const std::string& path);

/**
 * @brief Map a language tag to its reference family
 */
LanguageFamily familyOf(Language language);

std::string familyName(LanguageFamily family);

/**
 * @brief All language tags that have a reference family
 */
const std::vector<Language>& supportedLanguages();

} // namespace RepoLens
