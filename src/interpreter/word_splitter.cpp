#include "word_splitter.h"

namespace word_splitter {

bool is_ifs_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

std::vector<std::string> word_split(const std::string& text,
                                    const std::optional<std::string>& ifs) {
    std::vector<std::string> fields;
    if (ifs.has_value() && ifs->empty()) {
        if (!text.empty()) {
            fields.push_back(text);
        }
        return fields;
    }

    const std::string separators = ifs.value_or(DEFAULT_IFS);
    std::string current;
    bool has_content = false;
    bool pending_break = false;

    for (char c : text) {
        if (separators.find(c) != std::string::npos) {
            if (is_ifs_whitespace(c)) {
                if (has_content) {
                    pending_break = true;
                }
                continue;
            }
            fields.push_back(current);
            current.clear();
            has_content = false;
            pending_break = false;
            continue;
        }
        if (pending_break) {
            fields.push_back(current);
            current.clear();
            pending_break = false;
        }
        current += c;
        has_content = true;
    }

    if (has_content) {
        fields.push_back(current);
    }
    return fields;
}

}  // namespace word_splitter
