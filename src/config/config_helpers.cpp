#include <fstream>
#include <wikichunk/config/config_helpers.h>

namespace wikichunk::config {

std::optional<std::string> parse_config_value(const std::filesystem::path& config_path,
                                              const std::string& section,
                                              const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    std::string currentSection;
    const std::string dottedKey = section.empty() ? key : section + "." + key;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments
        size_t comment = v.find('#');
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        bool inSection = section.empty() || currentSection == section;
        if ((inSection && k == key) || (currentSection.empty() && k == dottedKey)) {
            return unquote(v);
        }
    }

    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* cfg_env = std::getenv("WIKICHUNK_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".config") / "wikichunk" / "config.toml";
    }

    return configHome / "wikichunk" / "config.toml";
}

} // namespace wikichunk::config
