// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/extensions/display_refresh_rate.hpp"

#include <backend/extension_gate.hpp>
#include <logging/log.hpp>

#include <sstream>

namespace xrext::display_refresh_rate
{

namespace
{

// Puts the rate captured at construction back when the scope ends
class RateRestorer
{
public:
    RateRestorer(const IXrBackend& backend, std::optional<float> previous, bool with_log)
        : backend_(backend), previous_(previous), with_log_(with_log)
    {
    }

    ~RateRestorer()
    {
        if (previous_)
        {
            set(backend_, *previous_, with_log_);
        }
    }

    RateRestorer(const RateRestorer&) = delete;
    RateRestorer& operator=(const RateRestorer&) = delete;

private:
    const IXrBackend& backend_;
    std::optional<float> previous_;
    bool with_log_;
};

std::string format_rates(const std::vector<float>& rates)
{
    std::ostringstream out;
    for (size_t i = 0; i < rates.size(); ++i)
    {
        out << (i ? ", " : "") << rates[i];
    }
    return out.str();
}

bool available_or_warn(const IXrBackend& backend, const char* operation)
{
    if (is_available(backend))
    {
        return true;
    }
    logging::warn(std::string("[DisplayRefreshRate] ") + operation + ": " + EXTENSION_NAME + " extension not available");
    return false;
}

} // anonymous namespace

const std::vector<float>& usual_fps_suspects()
{
    static const std::vector<float> suspects = { 30.0f,  60.0f,  72.0f,  80.0f,  90.0f,  100.0f,
                                                 110.0f, 120.0f, 144.0f, 165.0f, 240.0f, 360.0f };
    return suspects;
}

bool is_available(const IXrBackend& backend)
{
    return xrext::probe(backend, EXTENSION_NAME);
}

std::vector<float> enumerate(const IXrBackend& backend, bool with_log)
{
    std::vector<float> rates;
    if (!available_or_warn(backend, "enumerate"))
    {
        return rates;
    }

    auto enumerate_fn = resolve<PFN_xrEnumerateDisplayRefreshRatesFB>(backend, "xrEnumerateDisplayRefreshRatesFB");
    if (!enumerate_fn)
    {
        logging::warn("[DisplayRefreshRate] xrEnumerateDisplayRefreshRatesFB could not be resolved");
        return rates;
    }

    const XrSession session = backend.session();
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, float* out) { return (*enumerate_fn)(session, capacity, count, out); },
        rates);
    if (result != XR_SUCCESS)
    {
        logging::err("[DisplayRefreshRate] xrEnumerateDisplayRefreshRatesFB failed: " + std::to_string(result));
        return {};
    }

    if (with_log)
    {
        logging::info("[DisplayRefreshRate] " + std::to_string(rates.size()) + " display rate(s): " + format_rates(rates));
    }
    return rates;
}

std::optional<float> get_current(const IXrBackend& backend)
{
    if (!available_or_warn(backend, "get_current"))
    {
        return std::nullopt;
    }

    auto get_fn = resolve<PFN_xrGetDisplayRefreshRateFB>(backend, "xrGetDisplayRefreshRateFB");
    if (!get_fn)
    {
        logging::warn("[DisplayRefreshRate] xrGetDisplayRefreshRateFB could not be resolved");
        return std::nullopt;
    }

    float rate = 0.0f;
    XrResult result = (*get_fn)(backend.session(), &rate);
    if (result != XR_SUCCESS)
    {
        logging::err("[DisplayRefreshRate] xrGetDisplayRefreshRateFB failed: " + std::to_string(result));
        return std::nullopt;
    }
    return rate;
}

bool set(const IXrBackend& backend, float rate, bool with_log)
{
    if (!available_or_warn(backend, "set"))
    {
        return false;
    }

    auto request_fn = resolve<PFN_xrRequestDisplayRefreshRateFB>(backend, "xrRequestDisplayRefreshRateFB");
    if (!request_fn)
    {
        logging::warn("[DisplayRefreshRate] xrRequestDisplayRefreshRateFB could not be resolved");
        return false;
    }

    XrResult result = (*request_fn)(backend.session(), rate);
    if (result != XR_SUCCESS)
    {
        if (with_log)
        {
            std::ostringstream msg;
            msg << "[DisplayRefreshRate] xrRequestDisplayRefreshRateFB(" << rate << ") failed: " << result;
            logging::err(msg.str());
        }
        return false;
    }
    return true;
}

std::vector<float> probe(const IXrBackend& backend, const std::vector<float>& candidates, bool with_log)
{
    std::vector<float> accepted;
    if (!available_or_warn(backend, "probe"))
    {
        return accepted;
    }

    RateRestorer restorer(backend, get_current(backend), with_log);

    for (float rate : candidates)
    {
        if (set(backend, rate, false))
        {
            accepted.push_back(rate);
        }
    }

    if (with_log)
    {
        logging::info("[DisplayRefreshRate] " + std::to_string(accepted.size()) +
                      " display rate(s) from the given selection: " + format_rates(accepted));
    }
    return accepted;
}

} // namespace xrext::display_refresh_rate
