#include <labyrinth/content/room.hpp>
#include <labyrinth/content/json_loader.hpp>
#include <algorithm>

namespace labyrinth::content {

bool Room::lists_connection(const std::string& room_id) const {
    return std::find(connections.begin(), connections.end(), room_id) != connections.end();
}

std::optional<Room> deserialize_room(const nlohmann::json& j, std::string& out_error) {
    using namespace json_helpers;

    if (!require_string(j, "id", out_error)) {
        return std::nullopt;
    }

    Room room;
    room.id = j["id"].get<std::string>();

    if (!require_string(j, "name", out_error) ||
        !require_array(j, "connections", out_error)) {
        out_error = "Room '" + room.id + "': " + out_error;
        return std::nullopt;
    }

    room.name = j["name"].get<std::string>();
    room.description = get_string(j, "description");
    room.preferred_category = get_string(j, "preferred_category", "general");
    room.is_starting_room = get_bool(j, "is_starting_room", false);

    for (const auto& connection : j["connections"]) {
        if (!connection.is_string()) {
            out_error = "Room '" + room.id + "': connections must be room id strings";
            return std::nullopt;
        }
        room.connections.push_back(connection.get<std::string>());
    }

    return room;
}

} // namespace labyrinth::content
