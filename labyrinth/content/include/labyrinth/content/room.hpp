#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace labyrinth::content {

// ============================================================================
// Room
// ============================================================================

struct Room {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> connections;   // Declared neighbour ids, in order
    std::string preferred_category;         // Question category asked here
    bool is_starting_room = false;

    bool lists_connection(const std::string& room_id) const;
};

// Deserialize {id, name, description, connections[], preferred_category, is_starting_room}
std::optional<Room> deserialize_room(const nlohmann::json& j, std::string& out_error);

} // namespace labyrinth::content
