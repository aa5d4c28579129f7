#include <semrex/pattern/fragments.hpp>
#include <cstring>

namespace semrex {

std::string quote_meta(const std::string& literal) {
    static const char* const kMeta = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (c != '\0' && std::strchr(kMeta, c)) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string anchor(const std::string& body) {
    return "^" + body + "$";
}

std::string strip_anchors(const std::string& pattern) {
    std::string body = pattern;
    if (!body.empty() && body.front() == '^') body.erase(0, 1);
    if (!body.empty() && body.back() == '$') body.pop_back();
    return body;
}

std::string join_alternatives(const std::vector<std::string>& alternatives) {
    if (alternatives.empty()) return kNever;
    if (alternatives.size() == 1) return alternatives.front();

    std::string out = "(?:";
    for (size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) out += "|";
        out += alternatives[i];
    }
    out += ")";
    return out;
}

std::string digit_run(int count) {
    if (count <= 0) return "";
    if (count == 1) return R"(\d)";
    return R"(\d{)" + std::to_string(count) + "}";
}

std::string digit_class(int lo, int hi) {
    if (lo == hi) return std::string(1, static_cast<char>('0' + lo));
    std::string out = "[";
    out.push_back(static_cast<char>('0' + lo));
    out.push_back('-');
    out.push_back(static_cast<char>('0' + hi));
    out.push_back(']');
    return out;
}

bool is_never(const std::string& fragment) {
    return fragment == kNever;
}

} // namespace semrex
