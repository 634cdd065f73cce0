#pragma once

#include "session.hpp"

#include <string>

// What the status surface needs to render one frame.
struct StatusView {
    SessionState state = SessionState::Idle;
    SessionOptions options;
    ClipboardSnapshot::Kind clipboard = ClipboardSnapshot::Kind::Empty;
    bool has_terminology = false;
    size_t history_turns = 0;
    double recording_s = 0.0;
    std::string message; // error text in Error, result text in ShowingResult
};

class Presenter {
public:
    virtual ~Presenter() = default;
    virtual void show(const StatusView& view) = 0;
    virtual void hide() = 0;
    virtual void level(float value) = 0;
};
