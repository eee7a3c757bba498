/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/vault/RebalancingController.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

struct DepositEvent
{
    Timestamp timestamp;
    AccountId caller;
    AccountId receiver;
    decimal_t assets;
    decimal_t shares;
};

struct WithdrawEvent
{
    Timestamp timestamp;
    AccountId caller;
    AccountId receiver;
    AccountId owner;
    decimal_t assets;
    decimal_t shares;
};

// Fired once the operation has committed.
struct VaultSignals
{
    UnsyncSignal<void(const DepositEvent&)> deposit;
    UnsyncSignal<void(const WithdrawEvent&)> withdraw;
    UnsyncSignal<void(const RebalanceReport&)> rebalance;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
