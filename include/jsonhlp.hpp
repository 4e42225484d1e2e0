// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/istreamwrapper.h>

#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;


// A namespace to keep our helper functions organized
namespace jhlp {

    inline std::string parse_error(const rapidjson::Document& document) {
        return std::string(rapidjson::GetParseError_En(document.GetParseError()))
               + " at offset " + std::to_string(document.GetErrorOffset());
    }

    // Parse a JSON string into a RapidJSON Document.
    // On failure returns false and fills *err (when given) with the reason.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document, std::string* err = nullptr) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            if (err) *err = "JSON Parse Error: " + parse_error(document);
            return false;
        }
        return true;
    }

    // Parse a JSON file into a RapidJSON Document.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document, std::string* err = nullptr) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            if (err) *err = "Failed to open file: " + file_path;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            if (err) *err = "JSON Parse Error in file " + file_path + ": " + parse_error(document);
            return false;
        }
        return true;
    }

    // Stringify a RapidJSON Value into a std::string.
    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    inline bool write_file(const std::string& file_path, const rapidjson::Value& value) {
        std::ofstream ofs(file_path, std::ios::trunc);
        if (!ofs.is_open()) return false;
        ofs << stringify(value, true) << '\n';
        return static_cast<bool>(ofs);
    }

    // --- Helper functions for element access (mimicking nlohmann/json) ---

    // Get a value from an object member.
    // Returns default_value if the key is not found or the type is incorrect.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        return default_value;
    }

    inline bool has_string(const rapidjson::Value& parent, const char* key) {
        if (!parent.IsObject()) return false;
        auto it = parent.FindMember(key);
        return it != parent.MemberEnd() && it->value.IsString();
    }

    // Add a member to an object value; strings are copied into the allocator.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value.c_str(), allocator).Move(),
                             allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             value,
                             allocator);
        }
    }

    // Overload for Values that must be moved in (objects / arrays).
    inline void set_value(rapidjson::Value& parent, const std::string& key, rapidjson::Value& value, jdaloc& allocator) {
        parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(), value, allocator);
    }

} // namespace jhlp
