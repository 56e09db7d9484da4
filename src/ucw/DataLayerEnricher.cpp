//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DataLayerEnricher.cpp
// Purpose: Builds the data layer (what was said) for captured frames
//==========================================================================================================

#include <algorithm>
#include <string>

#include "ucw/EnrichmentHook.h"

namespace ucw {

namespace {
bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Cuts at most maxBytes, backing off so a multibyte UTF-8 sequence is never split.
std::string truncate(std::string s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) {
        return s;
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    s.resize(cut);
    return s;
}

std::string inboundContent(const std::string& method, const JSONValue& params) {
    if (method == "tools/call") {
        std::string args = "{}";
        if (const JSONValue* a = FindMember(params, "arguments")) {
            args = SerializeJSONValue(*a);
        }
        return "Tool call: " + GetString(params, "name").value_or("") + " | args=" + args;
    }
    if (endsWith(method, "/list")) {
        return "List " + method.substr(0, method.find('/'));
    }
    if (endsWith(method, "/read")) {
        return "Read resource: " + GetString(params, "uri").value_or("");
    }
    return "Method: " + method;
}

std::string outboundContent(const JSONValue& frame) {
    if (const JSONValue* err = FindMember(frame, "error")) {
        return "Error: " + GetString(*err, "message").value_or("");
    }
    const JSONValue* result = FindMember(frame, "result");
    if (result == nullptr) {
        // Outbound request or notification
        return "Method: " + GetString(frame, "method").value_or("");
    }
    const JSONValue* content = FindMember(*result, "content");
    if (content != nullptr && content->isArray()) {
        std::string joined;
        for (const auto& part : std::get<JSONValue::Array>(content->value)) {
            if (!part || !part->isObject()) {
                continue;
            }
            if (!joined.empty()) {
                joined.push_back(' ');
            }
            joined += truncate(GetString(*part, "text").value_or(""), DataLayerEnricher::MaxPartBytes);
        }
        return joined;
    }
    return SerializeJSONValue(*result);
}
} // namespace

void DataLayerEnricher::Enrich(CaptureEvent& event) {
    if (event.error.has_value()) {
        return;
    }
    JSONValue params{JSONValue::Object{}};
    if (const JSONValue* p = FindMember(event.frame, "params")) {
        params = *p;
    }
    std::string content = (event.direction == Direction::Inbound)
        ? inboundContent(event.method, params)
        : outboundContent(event.frame);
    content = truncate(std::move(content), MaxContentBytes);

    const int64_t tokensEst = std::max<int64_t>(1, static_cast<int64_t>(content.size() / 4));
    event.dataLayer = MakeObject({
        {"method", JSONValue(event.method)},
        {"content", JSONValue(content)},
        {"tokens_est", JSONValue(tokensEst)}
    });
}

} // namespace ucw
