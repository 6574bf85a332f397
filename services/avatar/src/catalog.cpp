#include "../include/catalog.hpp"
#include <algorithm>

namespace {
bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string quoted_list(const std::vector<std::string>& v) {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ", ";
        out += "'" + v[i] + "'";
    }
    return out + "]";
}
}

const Catalog& avatar_catalog() {
    static const Catalog avatars = {
        {"harry", {"business", "casual", "youthful"}},
        {"jeff", {"business", "formal"}},
        {"lisa", {"casual-sitting", "graceful-sitting", "graceful-standing", "technical-sitting", "technical-standing"}},
        {"lori", {"casual", "graceful", "formal"}},
        {"max", {"business", "casual", "formal"}},
        {"meg", {"formal", "casual", "business"}},
    };
    return avatars;
}

const Catalog& voice_catalog() {
    static const Catalog voices = {
        {"female", {"th-TH-PremwadeeNeural", "th-TH-AcharaNeural"}},
        {"male", {"th-TH-NiwatNeural"}},
    };
    return voices;
}

std::optional<std::string> validate_avatar_params(const SynthesisRequest& request) {
    bool voice_ok = false;
    for (const auto& kv : voice_catalog()) {
        if (contains(kv.second, request.voice)) { voice_ok = true; break; }
    }
    if (!voice_ok) {
        return "Invalid voice '" + request.voice + "'. See GET /voices for options.";
    }
    auto it = avatar_catalog().find(request.avatar_character);
    if (it == avatar_catalog().end()) {
        return "Invalid character '" + request.avatar_character + "'. See GET /models for options.";
    }
    if (!contains(it->second, request.avatar_style)) {
        return "Invalid style '" + request.avatar_style + "' for character '" + request.avatar_character +
               "'. Valid: " + quoted_list(it->second);
    }
    return std::nullopt;
}
