/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::swap
{

//-------------------------------------------------------------------------

struct SwapRequest
{
    AssetId assetIn;
    AssetId assetOut;
    decimal_t amountIn;
    decimal_t minAmountOut;
    AccountId receiver;
};

//-------------------------------------------------------------------------

class SwapRouter
{
public:
    virtual ~SwapRouter() noexcept = default;

    // Takes amountIn of assetIn from the caller and pays at least
    // minAmountOut of assetOut to the receiver. Returns the amount paid.
    virtual decimal_t swapExactInput(const AccountId& caller, const SwapRequest& request) = 0;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::swap

//-------------------------------------------------------------------------
