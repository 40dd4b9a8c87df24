#pragma once

#include <iostream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

// transport envelope, the protocol payload travels in data
struct Message {
    std::string type;
    int from{-1};
    int to{-1}; // filled in by the net manager per receiver
    json data;

    Message() = default;

    Message(std::string type_, json data_, int from_ = -1, int to_ = -1)
        : type(std::move(type_)), from(from_), to(to_), data(std::move(data_)) {
    }

    bool operator==(const Message& other) const {
        return type == other.type && from == other.from && to == other.to
               && data == other.data;
    }

    friend std::ostream& operator<<(std::ostream& out, const Message& msg) {
        out << "{" << msg.type << ", " << msg.from << " -> " << msg.to << ", " << msg.data << "}";
        return out;
    }
};
