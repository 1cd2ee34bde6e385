#include "ScanIgnore.h"
#include "utils/Logger.h"
#include <regex>

struct ScanIgnoreRules::Impl {
    std::vector<std::string> patternStrings;
    std::vector<std::regex> compiled;

    void compile() {
        for (const auto& s : patternStrings) {
            try {
                compiled.emplace_back(s, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                // 无效正则则跳过该条
                Logger::getInstance().warn("[ScanIgnore] Invalid ignore pattern '" + s + "': " + e.what());
            }
        }
    }
};

ScanIgnoreRules::ScanIgnoreRules(std::vector<std::string> patterns)
    : impl_(std::make_unique<Impl>()) {
    impl_->patternStrings = std::move(patterns);
    impl_->compile();
}

ScanIgnoreRules::~ScanIgnoreRules() = default;

const std::unordered_set<std::string>& ScanIgnoreRules::defaultNames() {
    static const std::unordered_set<std::string> names = {
        // Node.js / frontend
        "node_modules", "bower_components", ".yarn", ".pnpm-store", ".pnp", ".pnp.js",
        // IDE / editor
        ".idea", ".vscode", ".vscodespaces", ".history",
        // Python / virtualenv / caches
        ".venv", "venv", "ENV", "env", "__pycache__", ".mypy_cache", ".pytest_cache", ".cache",
        ".pdm-cache", ".tox",
        // Java / JVM / Gradle / Maven
        "build", "target", ".gradle", ".m2", ".ivy2",
        // Ruby / gems
        "vendor", ".bundle",
        // C / C++ build
        "bin", "obj",
        // Frontend / framework build
        "dist", "out", ".next", ".nuxt", ".serverless", ".parcel-cache", ".cache-loader",
        // Containers / infra
        ".terraform", ".vagrant",
        // Misc caches
        "coverage", ".sass-cache", ".DS_Store", "Thumbs.db",
        // Version control
        ".git", ".gitignore", ".svn", ".hg", "CVS",
        // System / platform folders
        "Program Files", "Program Files (x86)", "ProgramData", "Windows"
    };
    return names;
}

bool ScanIgnoreRules::shouldIgnore(const std::string& name) const {
    if (defaultNames().count(name)) return true;

    for (const auto& re : impl_->compiled) {
        if (std::regex_search(name, re)) return true;
    }
    return false;
}
