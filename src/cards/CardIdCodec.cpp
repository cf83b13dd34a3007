#include "cards/CardIdCodec.hpp"

namespace cardindex {

const std::vector<std::pair<std::string, std::string>>& filename_token_table() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"_excl_", "!"},
        {"_qmark_", "?"},
        {"_star_", "*"},
        {"_lt_", "<"},
        {"_gt_", ">"},
        {"_quot_", "\""},
        {"_pipe_", "|"},
        {"_bslash_", "\\"},
        {"_slash_", "/"},
        {"_colon_", ":"},
        {"_pct_", "%"},
    };
    return table;
}

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string filename_to_card_id(const std::string& stem) {
    std::string out = stem;
    for (const auto& kv : filename_token_table()) out = replace_all(std::move(out), kv.first, kv.second);
    return out;
}

std::string card_id_to_filename(const std::string& card_id) {
    std::string out;
    out.reserve(card_id.size());
    for (char c : card_id) {
        bool mapped = false;
        for (const auto& kv : filename_token_table()) {
            if (kv.second.size() == 1 && kv.second[0] == c) {
                out += kv.first;
                mapped = true;
                break;
            }
        }
        if (!mapped) out += c;
    }
    return out;
}

}  // namespace cardindex
