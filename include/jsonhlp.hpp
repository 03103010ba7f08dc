// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <type_traits>
#include <vector>
#include "lib.hpp"
#include "logger.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jalloc = rapidjson::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. Logs and returns false on a parse error.
    inline bool parse_str(const std::string& json_string, jdoc& document) {
        document.Parse(json_string.c_str(), json_string.size());
        if (document.HasParseError()) {
            LOG_WARN("JSON parse error: {} at offset {}",
                     rapidjson::GetParseError_En(document.GetParseError()),
                     document.GetErrorOffset());
            return false;
        }
        return true;
    }

    inline bool parse_file(const std::string& file_path, jdoc& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            LOG_WARN("Failed to open file: {}", file_path);
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            LOG_WARN("JSON parse error in file {}: {} at offset {}", file_path,
                     rapidjson::GetParseError_En(document.GetParseError()),
                     document.GetErrorOffset());
            return false;
        }
        return true;
    }

    inline std::string stringify(const jval& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Value of parent[key] when present and of type T, default_value otherwise.
    template<typename T>
    inline T get(const jval& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject()) return default_value;
        auto it = parent.FindMember(key.c_str());
        if (it == parent.MemberEnd()) return default_value;
        const jval& val = it->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return std::string(val.GetString(), val.GetStringLength());
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        }
        return default_value;
    }

    inline bool has(const jval& parent, const std::string& key) {
        return parent.IsObject() && parent.HasMember(key.c_str());
    }

    // Object member or nullptr.
    inline const jval* member(const jval& parent, const std::string& key) {
        if (!parent.IsObject()) return nullptr;
        auto it = parent.FindMember(key.c_str());
        return it == parent.MemberEnd() ? nullptr : &it->value;
    }

    // Array of strings (non-string elements are skipped); empty when absent.
    inline strings get_strings(const jval& parent, const std::string& key) {
        strings out;
        const jval* arr = member(parent, key);
        if (!arr || !arr->IsArray()) return out;
        for (const auto& el : arr->GetArray()) {
            if (el.IsString()) out.emplace_back(el.GetString(), el.GetStringLength());
        }
        return out;
    }

    inline strings to_strings(const jval& arr) {
        strings out;
        if (!arr.IsArray()) return out;
        for (const auto& el : arr.GetArray()) {
            if (el.IsString()) out.emplace_back(el.GetString(), el.GetStringLength());
        }
        return out;
    }

    inline jval str_val(const std::string& value, jalloc& a) {
        return jval(value.c_str(), static_cast<json::SizeType>(value.size()), a);
    }

    inline jval str_array(const strings& items, jalloc& a) {
        jval arr(json::kArrayType);
        for (const auto& s : items) arr.PushBack(str_val(s, a), a);
        return arr;
    }

    inline void set(jval& parent, const std::string& key, const std::string& value, jalloc& a) {
        parent.AddMember(str_val(key, a), str_val(value, a), a);
    }

    inline void set(jval& parent, const std::string& key, const char* value, jalloc& a) {
        set(parent, key, std::string(value), a);
    }

    inline void set(jval& parent, const std::string& key, bool value, jalloc& a) {
        parent.AddMember(str_val(key, a), jval(value), a);
    }

    inline void set(jval& parent, const std::string& key, int64_t value, jalloc& a) {
        parent.AddMember(str_val(key, a), jval(value), a);
    }

    inline void set(jval& parent, const std::string& key, const strings& value, jalloc& a) {
        parent.AddMember(str_val(key, a), str_array(value, a), a);
    }

    // Takes ownership of value (moved).
    inline void set(jval& parent, const std::string& key, jval& value, jalloc& a) {
        parent.AddMember(str_val(key, a), value, a);
    }

} // namespace jhlp
