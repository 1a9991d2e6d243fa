#include <fstream>
#include <memex/config/config_helpers.h>

namespace memex::config {

namespace {

std::filesystem::path xdg_dir(const char* xdgVar, const char* homeFallback) {
    if (const char* xdg = std::getenv(xdgVar); xdg && *xdg) {
        return std::filesystem::path(xdg) / "memex";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / homeFallback / "memex";
    }
    return std::filesystem::current_path() / ".memex";
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[' && line.find('=') == std::string::npos) {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
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

        // Inline comments: cut after the closing quote or bracket, else at the first '#'
        if (!v.empty()) {
            const char open = v.front();
            const char close = open == '[' ? ']' : open;
            if (open == '"' || open == '\'' || open == '[') {
                size_t end = v.find(close, 1);
                if (end != std::string::npos) {
                    v = v.substr(0, end + 1);
                }
            } else if (size_t comment = v.find('#'); comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "index.paths" and "[index] paths"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            if (!v.empty() && v.front() == '[') {
                return v;
            }
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        std::string item =
            body.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::vector<std::filesystem::path> parse_path_list(const std::string& raw) {
    std::vector<std::filesystem::path> out;
    for (const auto& item : parse_string_list(raw)) {
        out.push_back(expand_tilde(item));
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("MEMEX_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }
    return xdg_dir("XDG_CONFIG_HOME", ".config") / "config.toml";
}

std::filesystem::path get_data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::filesystem::path get_cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", ".cache");
}

} // namespace memex::config
