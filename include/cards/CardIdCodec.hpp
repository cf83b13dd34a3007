#pragma once
#include <string>
#include <utility>
#include <vector>

namespace cardindex {

// Filesystem-safe token -> character, applied in this order.
// Tokens never overlap, so the order only matters for determinism.
const std::vector<std::pair<std::string, std::string>>& filename_token_table();

// "sv4pt5-1_slash_2" -> "sv4pt5-1/2"
std::string filename_to_card_id(const std::string& stem);

// Inverse mapping. An id that literally contains a token does not round-trip.
std::string card_id_to_filename(const std::string& card_id);

}  // namespace cardindex
