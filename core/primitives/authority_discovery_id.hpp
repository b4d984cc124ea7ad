/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

/// Public key under which a validator publishes its addresses; the transport
/// resolves it to a network peer.
TRIBUNE_BLOB_STRICT_TYPEDEF(tribune::primitives, AuthorityDiscoveryId, 32);
