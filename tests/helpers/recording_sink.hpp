#pragma once

/**
 * @file recording_sink.hpp
 * @brief EventSink that records events as short strings for comparison.
 */

#include "dcb/dcb_event_sink.h"

#include <string>
#include <string_view>
#include <vector>

namespace test_helpers {

/**
 * @brief Records "StartMapping", "EndMapping", "StartSequence", "EndSequence" and
 * "Scalar(<text>)".
 */
class RecordingSink : public darkcfg::dcb::EventSink {
public:
    void start_mapping() override { events.emplace_back("StartMapping"); }
    void end_mapping() override { events.emplace_back("EndMapping"); }
    void start_sequence() override { events.emplace_back("StartSequence"); }
    void end_sequence() override { events.emplace_back("EndSequence"); }
    void scalar(std::string_view value) override {
        events.push_back("Scalar(" + std::string(value) + ")");
    }

    std::vector<std::string> events;
};

} // namespace test_helpers
