#include <mediarepo/config/config_helpers.h>

namespace mediarepo::config {

namespace {

// Strip a trailing comment that is not inside quotes
void stripInlineComment(std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

ConfigSections parse_config_sections(std::istream& in) {
    ConfigSections sections;
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
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
                sections[currentSection];
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
        stripInlineComment(v);
        if (!k.empty()) {
            sections[currentSection][k] = unquote(v);
        }
    }
    return sections;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "mediarepo";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "mediarepo";
    }
    return std::filesystem::current_path() / ".mediarepo";
}

std::filesystem::path get_data_dir() {
    if (const char* xdgData = std::getenv("XDG_DATA_HOME"); xdgData && *xdgData) {
        return std::filesystem::path(xdgData) / "mediarepo";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "mediarepo";
    }
    return std::filesystem::current_path() / "mediarepo_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("MEDIAREPO_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace mediarepo::config
