// cppcheck-suppress-file missingIncludeSystem
#include "label_format.hpp"

#include <algorithm>

namespace sysattr {

bool is_label_alnum(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
}

bool is_label_char(char c)
{
    return is_label_alnum(c) || c == '_' || c == '.';
}

std::string build_attribute_name(const std::string& cleaned_path, size_t max_len)
{
    std::string name = cleaned_path;
    std::replace(name.begin(), name.end(), '/', '.');
    if (!name.empty() && name.front() == '.') {
        name.erase(0, 1);
    }

    if (name.size() > max_len) {
        // Drop leading directory names, cutting on the next segment boundary.
        const size_t start = name.size() - max_len;
        const size_t dot = name.find('.', start);
        name = (dot == std::string::npos) ? name.substr(start) : name.substr(dot + 1);
    }
    return name;
}

std::string sanitize_label_value(const std::string& raw)
{
    if (raw.empty()) {
        return raw;
    }

    size_t i = 0;
    while (i < raw.size() && !is_label_alnum(raw[i])) {
        ++i;
    }

    std::string value;
    value.reserve(raw.size() - i);
    bool in_invalid_run = false;
    for (; i < raw.size(); ++i) {
        const char c = raw[i];
        if (is_label_char(c)) {
            value.push_back(c);
            in_invalid_run = false;
        } else if (!in_invalid_run) {
            value.push_back('_');
            in_invalid_run = true;
        }
    }

    if (value.size() > kLabelValueMax) {
        value.resize(kLabelValueMax);
    }
    while (!value.empty() && !is_label_alnum(value.back())) {
        value.pop_back();
    }
    return value;
}

std::string sanitize_label_key(const std::string& in)
{
    std::string out;
    out.reserve(in.size());
    bool in_invalid_run = false;
    for (char c : in) {
        if (is_label_char(c)) {
            out.push_back(c);
            in_invalid_run = false;
        } else if (!in_invalid_run) {
            out.push_back('_');
            in_invalid_run = true;
        }
    }
    return out;
}

} // namespace sysattr
