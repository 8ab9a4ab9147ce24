// =================================================================
// src/RepoLens/Language.cpp
// =================================================================
// Implementation for language tags and extension detection.

#include "RepoLens/Language.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace RepoLens {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string languageName(Language language) {
    switch (language) {
        case Language::TypeScript: return "TypeScript";
        case Language::TypeScriptReact: return "TypeScript React";
        case Language::JavaScript: return "JavaScript";
        case Language::JavaScriptReact: return "JavaScript React";
        case Language::Python: return "Python";
        case Language::Java: return "Java";
        case Language::Go: return "Go";
        case Language::C: return "C";
        case Language::CHeader: return "C Header";
        case Language::Cpp: return "C++";
        case Language::CppHeader: return "C++ Header";
        case Language::Rust: return "Rust";
        case Language::Swift: return "Swift";
        case Language::Other: return "Other";
    }
    return "Other";
}

Language languageFromName(const std::string& name) {
    static const std::unordered_map<std::string, Language> names = {
        {"typescript", Language::TypeScript},
        {"ts", Language::TypeScript},
        {"typescript react", Language::TypeScriptReact},
        {"tsx", Language::TypeScriptReact},
        {"javascript", Language::JavaScript},
        {"js", Language::JavaScript},
        {"javascript react", Language::JavaScriptReact},
        {"jsx", Language::JavaScriptReact},
        {"python", Language::Python},
        {"java", Language::Java},
        {"go", Language::Go},
        {"c", Language::C},
        {"c header", Language::CHeader},
        {"c++", Language::Cpp},
        {"cpp", Language::Cpp},
        {"c++ header", Language::CppHeader},
        {"rust", Language::Rust},
        {"swift", Language::Swift}
    };

    auto it = names.find(toLower(name));
    return it != names.end() ? it->second : Language::Other;
}

Language detectLanguage(const std::string& path) {
    static const std::unordered_map<std::string, Language> extensions = {
        {"ts", Language::TypeScript},
        {"mts", Language::TypeScript},
        {"cts", Language::TypeScript},
        {"tsx", Language::TypeScriptReact},
        {"js", Language::JavaScript},
        {"mjs", Language::JavaScript},
        {"cjs", Language::JavaScript},
        {"jsx", Language::JavaScriptReact},
        {"py", Language::Python},
        {"pyi", Language::Python},
        {"java", Language::Java},
        {"go", Language::Go},
        {"c", Language::C},
        {"h", Language::CHeader},
        {"cpp", Language::Cpp},
        {"cc", Language::Cpp},
        {"cxx", Language::Cpp},
        {"hpp", Language::CppHeader},
        {"hh", Language::CppHeader},
        {"hxx", Language::CppHeader},
        {"rs", Language::Rust},
        {"swift", Language::Swift}
    };

    size_t slash = path.find_last_of('/');
    std::string file_name = slash == std::string::npos ? path : path.substr(slash + 1);

    size_t dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return Language::Other;
    }

    auto it = extensions.find(toLower(file_name.substr(dot + 1)));
    return it != extensions.end() ? it->second : Language::Other;
}

LanguageFamily familyOf(Language language) {
    switch (language) {
        case Language::TypeScript:
        case Language::TypeScriptReact:
        case Language::JavaScript:
        case Language::JavaScriptReact:
            return LanguageFamily::JavaScript;
        case Language::Python:
            return LanguageFamily::Python;
        case Language::Java:
            return LanguageFamily::Java;
        case Language::Go:
            return LanguageFamily::Go;
        case Language::C:
        case Language::CHeader:
        case Language::Cpp:
        case Language::CppHeader:
            return LanguageFamily::CFamily;
        case Language::Rust:
            return LanguageFamily::Rust;
        case Language::Swift:
            return LanguageFamily::Swift;
        case Language::Other:
            return LanguageFamily::Unsupported;
    }
    return LanguageFamily::Unsupported;
}

std::string familyName(LanguageFamily family) {
    switch (family) {
        case LanguageFamily::JavaScript: return "JavaScript/TypeScript";
        case LanguageFamily::Python: return "Python";
        case LanguageFamily::Java: return "Java";
        case LanguageFamily::Go: return "Go";
        case LanguageFamily::CFamily: return "C/C++";
        case LanguageFamily::Rust: return "Rust";
        case LanguageFamily::Swift: return "Swift";
        case LanguageFamily::Unsupported: return "Unsupported";
    }
    return "Unsupported";
}

const std::vector<Language>& supportedLanguages() {
    static const std::vector<Language> languages = {
        Language::TypeScript, Language::TypeScriptReact,
        Language::JavaScript, Language::JavaScriptReact,
        Language::Python, Language::Java, Language::Go,
        Language::C, Language::CHeader, Language::Cpp, Language::CppHeader,
        Language::Rust, Language::Swift
    };
    return languages;
}

} // namespace RepoLens
