// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/stepper/steppers.hpp"

#include <logging/log.hpp>

#include <algorithm>
#include <exception>
#include <thread>

namespace xrext
{

Steppers::Steppers(XrContext& context) : context_(context)
{
}

Steppers::~Steppers()
{
    if (!shut_down_)
    {
        shutdown();
    }
}

void Steppers::add(const StepperId& id, std::unique_ptr<IStepper> stepper)
{
    if (!stepper)
    {
        logging::warn("[Steppers] Ignoring null stepper " + id);
        return;
    }
    Action action{ Action::Kind::Add, id, std::move(stepper), std::nullopt, {}, {} };
    actions_.push_back(std::move(action));
}

void Steppers::remove(const StepperId& id)
{
    actions_.push_back(Action{ Action::Kind::Remove, id, nullptr, std::nullopt, {}, {} });
}

void Steppers::remove_all(std::type_index type)
{
    actions_.push_back(Action{ Action::Kind::RemoveAll, {}, nullptr, type, {}, {} });
}

void Steppers::quit(const StepperId& from, const std::string& reason)
{
    actions_.push_back(Action{ Action::Kind::Quit, from, nullptr, std::nullopt, {}, reason });
}

void Steppers::send_event(const StepperId& from, const std::string& key, const std::string& value)
{
    actions_.push_back(Action{ Action::Kind::Event, from, nullptr, std::nullopt, key, value });
}

bool Steppers::contains(const StepperId& id) const
{
    return std::any_of(records_.begin(), records_.end(), [&](const Record& r) { return r.id == id; });
}

std::optional<StepperState> Steppers::state(const StepperId& id) const
{
    for (const auto& record : records_)
    {
        if (record.id == id)
        {
            return record.state;
        }
    }
    return std::nullopt;
}

bool Steppers::call_close(Record& record, bool triggering)
{
    try
    {
        return record.stepper->close(triggering);
    }
    catch (const std::exception& e)
    {
        // A stepper that cannot close is dropped as closed
        logging::err("[Steppers] Stepper " + record.id + " threw during close: " + e.what());
        return true;
    }
}

void Steppers::begin_close(Record& record)
{
    if (record.state == StepperState::Closing)
    {
        return;
    }
    record.state = StepperState::Closing;
    record.closed = call_close(record, true);
}

void Steppers::drop_faulted(Record& record, const char* phase, const std::exception& e)
{
    logging::err("[Steppers] Stepper " + record.id + " threw during " + phase + " and was dropped: " + e.what());
    begin_close(record);
}

void Steppers::drain_actions(std::vector<StepperEvent>& events)
{
    // Actions queued while draining (start callbacks) wait for the next frame
    std::deque<Action> pending;
    pending.swap(actions_);

    for (auto& action : pending)
    {
        switch (action.kind)
        {
        case Action::Kind::Add:
        {
            if (contains(action.id))
            {
                logging::warn("[Steppers] Stepper id already in use: " + action.id);
                break;
            }
            const IStepper& ref = *action.stepper;
            Record record{ action.id, std::move(action.stepper), std::type_index(typeid(ref)), StepperState::Initializing, false };
            if (start_stepper(record))
            {
                records_.push_back(std::move(record));
            }
            break;
        }
        case Action::Kind::Remove:
        {
            auto it = std::find_if(
                records_.begin(), records_.end(), [&](const Record& r) { return r.id == action.id; });
            if (it == records_.end())
            {
                logging::diag("[Steppers] remove: unknown stepper " + action.id);
                break;
            }
            begin_close(*it);
            break;
        }
        case Action::Kind::RemoveAll:
            for (auto& record : records_)
            {
                if (record.type == *action.type)
                {
                    begin_close(record);
                }
            }
            break;
        case Action::Kind::Quit:
            if (!quit_requested_)
            {
                quit_requested_ = true;
                quit_reason_ = action.value;
                logging::info("[Steppers] Quit requested by " + action.id + ": " + action.value);
            }
            break;
        case Action::Kind::Event:
            events.push_back(StepperEvent{ action.id, action.key, action.value });
            break;
        }
    }
}

bool Steppers::start_stepper(Record& record)
{
    bool started = false;
    try
    {
        started = record.stepper->start(record.id, context_);
    }
    catch (const std::exception& e)
    {
        logging::err("[Steppers] Stepper " + record.id + " threw during start: " + e.what());
        return false;
    }

    if (!started)
    {
        logging::warn("[Steppers] Stepper " + record.id + " failed to start and was dropped");
        return false;
    }
    return true;
}

void Steppers::initialize_pending()
{
    for (auto& record : records_)
    {
        if (record.state != StepperState::Initializing)
        {
            continue;
        }

        bool completed = false;
        try
        {
            completed = record.stepper->start_completed();
        }
        catch (const std::exception& e)
        {
            drop_faulted(record, "start_completed", e);
            continue;
        }

        if (completed)
        {
            record.state = StepperState::Running;
            send_event(record.id, ISTEPPER_RUNNING, "true");
        }
    }
}

bool Steppers::step()
{
    if (shut_down_)
    {
        return false;
    }

    token_.event_report.clear();
    token_.frame_index = frame_index_;

    // Steppers whose close(true) ran in an earlier frame
    std::vector<StepperId> already_closing;
    for (const auto& record : records_)
    {
        if (record.state == StepperState::Closing)
        {
            already_closing.push_back(record.id);
        }
    }

    drain_actions(token_.event_report);
    initialize_pending();

    // All events are delivered before any draw
    for (auto& record : records_)
    {
        if (record.state != StepperState::Running || !record.stepper->enabled())
        {
            continue;
        }
        try
        {
            for (const auto& event : token_.event_report)
            {
                record.stepper->check_event(event.from, event.key, event.value);
            }
        }
        catch (const std::exception& e)
        {
            drop_faulted(record, "check_event", e);
        }
    }

    for (auto& record : records_)
    {
        if (record.state != StepperState::Running || !record.stepper->enabled())
        {
            continue;
        }
        try
        {
            record.stepper->draw(token_);
        }
        catch (const std::exception& e)
        {
            drop_faulted(record, "draw", e);
        }
    }

    for (auto it = records_.begin(); it != records_.end();)
    {
        const bool polled = std::find(already_closing.begin(), already_closing.end(), it->id) != already_closing.end();
        if (polled && !it->closed)
        {
            it->closed = call_close(*it, false);
        }
        if (it->closed)
        {
            send_event(it->id, ISTEPPER_REMOVED, "true");
            it = records_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    ++frame_index_;
    return !quit_requested_;
}

void Steppers::shutdown(int max_polls, std::chrono::milliseconds poll_interval)
{
    if (shut_down_)
    {
        return;
    }
    shut_down_ = true;

    for (auto it = records_.rbegin(); it != records_.rend(); ++it)
    {
        begin_close(*it);
    }

    for (int poll = 0; poll < max_polls && !records_.empty(); ++poll)
    {
        for (auto it = records_.end(); it != records_.begin();)
        {
            --it;
            if (it->closed || call_close(*it, false))
            {
                it = records_.erase(it);
            }
        }
        if (!records_.empty())
        {
            std::this_thread::sleep_for(poll_interval);
        }
    }

    for (const auto& record : records_)
    {
        logging::warn("[Steppers] Stepper " + record.id + " did not finish closing");
    }
    records_.clear();
    actions_.clear();
}

} // namespace xrext
