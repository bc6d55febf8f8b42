//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Wire serialization of capabilities, tool descriptors, and tools/call results
//==========================================================================================================

#include "hostmcp/Protocol.h"

namespace hostmcp {

JSONValue SerializeServerCapabilities(const ServerCapabilities& capabilities) {
    JSONValue::Object caps;

    if (capabilities.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(capabilities.tools->listChanged);
        caps["tools"] = std::make_shared<JSONValue>(toolsObj);
    }

    if (capabilities.resources.has_value()) {
        JSONValue::Object resourcesObj;
        resourcesObj["subscribe"] = std::make_shared<JSONValue>(capabilities.resources->subscribe);
        resourcesObj["listChanged"] = std::make_shared<JSONValue>(capabilities.resources->listChanged);
        caps["resources"] = std::make_shared<JSONValue>(resourcesObj);
    }

    if (capabilities.prompts.has_value()) {
        JSONValue::Object promptsObj;
        promptsObj["listChanged"] = std::make_shared<JSONValue>(capabilities.prompts->listChanged);
        caps["prompts"] = std::make_shared<JSONValue>(promptsObj);
    }

    if (capabilities.logging.has_value()) {
        caps["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }

    return JSONValue(caps);
}

const char* ParameterTypeName(ParameterType type) {
    switch (type) {
        case ParameterType::String: return "string";
        case ParameterType::Number: return "number";
        case ParameterType::Boolean: return "boolean";
        case ParameterType::Array: return "array";
        case ParameterType::Object: return "object";
    }
    return "string";
}

bool MatchesParameterType(const JSONValue& value, ParameterType type) {
    switch (type) {
        case ParameterType::String: return value.isString();
        case ParameterType::Number: return value.isNumber();
        case ParameterType::Boolean: return value.isBool();
        case ParameterType::Array: return value.isArray();
        case ParameterType::Object: return value.isObject();
    }
    return false;
}

JSONValue ToolDefinitionToJSON(const ToolDefinition& def) {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : def.parameters) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(ParameterTypeName(p.type));
        prop["description"] = std::make_shared<JSONValue>(p.description);
        if (p.defaultValue.has_value()) {
            prop["default"] = std::make_shared<JSONValue>(p.defaultValue.value());
        }
        if (!p.enumValues.empty()) {
            JSONValue::Array values;
            for (const auto& e : p.enumValues) {
                values.push_back(std::make_shared<JSONValue>(e));
            }
            prop["enum"] = std::make_shared<JSONValue>(values);
        }
        properties[p.name] = std::make_shared<JSONValue>(prop);
        if (p.required) {
            required.push_back(std::make_shared<JSONValue>(p.name));
        }
    }

    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(properties);
    schema["required"] = std::make_shared<JSONValue>(required);

    JSONValue::Object annotations;
    annotations["category"] = std::make_shared<JSONValue>(def.category);
    annotations["requiresAuth"] = std::make_shared<JSONValue>(def.requiresAuth);
    annotations["isDestructive"] = std::make_shared<JSONValue>(def.isDestructive);

    JSONValue::Object tool;
    tool["name"] = std::make_shared<JSONValue>(def.name);
    tool["description"] = std::make_shared<JSONValue>(def.description);
    tool["inputSchema"] = std::make_shared<JSONValue>(schema);
    tool["annotations"] = std::make_shared<JSONValue>(annotations);
    return JSONValue(tool);
}

JSONValue SerializeCallToolResult(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) {
        content.push_back(std::make_shared<JSONValue>(v));
    }
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue(obj);
}

} // namespace hostmcp
