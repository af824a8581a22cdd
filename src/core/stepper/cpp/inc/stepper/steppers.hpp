// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "stepper.hpp"

#include <chrono>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace xrext
{

constexpr const char* ISTEPPER_RUNNING = "IStepper_Running";
constexpr const char* ISTEPPER_REMOVED = "IStepper_Removed";

enum class StepperState
{
    Initializing,
    Running,
    Closing
};

/**
 * @brief Hosts steppers in insertion order and drives them once per frame.
 *
 * add / remove / remove_all / quit / send_event only queue an action, the queue is drained
 * at the start of the next step().
 */
class Steppers
{
public:
    explicit Steppers(XrContext& context);
    ~Steppers();

    Steppers(const Steppers&) = delete;
    Steppers& operator=(const Steppers&) = delete;

    void add(const StepperId& id, std::unique_ptr<IStepper> stepper);
    void remove(const StepperId& id);
    void remove_all(std::type_index type);

    template <typename T>
    void remove_all()
    {
        remove_all(std::type_index(typeid(T)));
    }

    void quit(const StepperId& from, const std::string& reason);
    void send_event(const StepperId& from, const std::string& key, const std::string& value);

    // Runs one frame. Returns false once a quit has been requested.
    bool step();

    // Closes every stepper in reverse insertion order, polling close(false) a bounded number of times
    void shutdown(int max_polls = 50, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    size_t size() const
    {
        return records_.size();
    }

    bool contains(const StepperId& id) const;
    std::optional<StepperState> state(const StepperId& id) const;

    bool quit_requested() const
    {
        return quit_requested_;
    }

    const std::string& quit_reason() const
    {
        return quit_reason_;
    }

    // Events delivered during the last step()
    const FrameToken& last_frame() const
    {
        return token_;
    }

private:
    struct Action
    {
        enum class Kind
        {
            Add,
            Remove,
            RemoveAll,
            Quit,
            Event
        };

        Kind kind;
        StepperId id;
        std::unique_ptr<IStepper> stepper;
        std::optional<std::type_index> type;
        std::string key;
        std::string value;
    };

    struct Record
    {
        StepperId id;
        std::unique_ptr<IStepper> stepper;
        std::type_index type;
        StepperState state;
        bool closed;
    };

    void drain_actions(std::vector<StepperEvent>& events);
    bool call_close(Record& record, bool triggering);
    void begin_close(Record& record);
    void drop_faulted(Record& record, const char* phase, const std::exception& e);
    void initialize_pending();
    bool start_stepper(Record& record);

    XrContext& context_;
    std::deque<Action> actions_;
    std::vector<Record> records_;
    FrameToken token_;
    uint64_t frame_index_ = 0;
    bool quit_requested_ = false;
    std::string quit_reason_;
    bool shut_down_ = false;
};

} // namespace xrext
