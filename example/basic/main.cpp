// main.cpp - Basic opack example

#include <opack/opack.h>

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace opack;

// ============================================================
// Domain types
// ============================================================

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Component {
    virtual ~Component() = default;
    std::string name;
};

struct Sprite : Component {
    std::string texture;
    int layer = 0;
};

struct GameObject {
    std::string id;
    Vec2 position;
    std::vector<std::string> tags;
    std::map<std::string, int> stats;
    std::optional<int> owner;
    std::shared_ptr<Component> component;
};

void register_types()
{
    reflect<Vec2>("Vec2").field("x", &Vec2::x).field("y", &Vec2::y);
    reflect<Component>("Component").field("name", &Component::name);
    reflect<Sprite>("Sprite")
        .base<Component>()
        .field("texture", &Sprite::texture)
        .field("layer", &Sprite::layer);
    reflect<GameObject>("GameObject")
        .field("id", &GameObject::id)
        .field("position", &GameObject::position)
        .field("tags", &GameObject::tags)
        .field("stats", &GameObject::stats)
        .field("owner", &GameObject::owner)
        .field("component", &GameObject::component).explicit_type<Sprite>();
}

int main()
{
    register_types();

    GameObject player;
    player.id = "player-1";
    player.position = {12.5f, -3.0f};
    player.tags = {"hero", "controllable"};
    player.stats = {{"hp", 100}, {"mana", 40}};

    auto sprite = std::make_shared<Sprite>();
    sprite->name = "body";
    sprite->texture = "hero.png";
    sprite->layer = 2;
    player.component = sprite;

    Opacker opacker;

    // -------------------------------------------------------
    // Native -> Value
    // -------------------------------------------------------
    Value value = opacker.serialize(player);
    std::cout << "serialized: " << value.to_string() << "\n";

    // -------------------------------------------------------
    // Value -> native
    // -------------------------------------------------------
    value.as_object().put("id", "player-2");
    value.as_object().put("owner", 7);

    try {
        auto copy = opacker.deserialize<GameObject>(value);
        auto* copy_sprite = dynamic_cast<Sprite*>(copy->component.get());

        std::cout << "deserialized: " << copy->id
                  << " at (" << copy->position.x << ", " << copy->position.y << ")"
                  << ", owner " << copy->owner.value_or(-1)
                  << ", sprite " << (copy_sprite ? copy_sprite->texture : std::string("<none>")) << "\n";
    } catch (const Error& e) {
        std::cerr << "deserialize failed: " << e.what() << "\n";
        return 1;
    }

    // -------------------------------------------------------
    // Compiled programs
    // -------------------------------------------------------
    auto baked = opacker.bake(type_of<Vec2>());
    std::cout << "Vec2 serialize program:\n" << baked->serialize_program().to_string();

    return 0;
}
