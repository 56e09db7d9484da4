//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnrichmentHook.h
// Purpose: Pluggable enrichment of capture events and the built-in data-layer enricher
//==========================================================================================================

#pragma once

#include <cstddef>

#include "ucw/CaptureEvent.h"

namespace ucw {

//==========================================================================================================
// IEnrichmentHook
// Purpose: Attaches derived payloads (data/light/instinct layers, coherence signature) to an event.
//          Called synchronously on the frame-handling path; must not block indefinitely.
//          Exceptions are caught and logged by the CaptureEngine.
//==========================================================================================================
class IEnrichmentHook {
public:
    virtual ~IEnrichmentHook() = default;
    virtual void Enrich(CaptureEvent& event) = 0;
};

//==========================================================================================================
// DataLayerEnricher
// Purpose: Fills CaptureEvent::dataLayer with { method, content, tokens_est } where content is a short
//          human-readable summary of the frame. Topic/intent classification is left to other hooks.
//==========================================================================================================
class DataLayerEnricher : public IEnrichmentHook {
public:
    static constexpr std::size_t MaxContentBytes = 2000;
    static constexpr std::size_t MaxPartBytes = 500;

    void Enrich(CaptureEvent& event) override;
};

} // namespace ucw
