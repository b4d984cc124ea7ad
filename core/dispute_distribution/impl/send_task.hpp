/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "dispute_distribution/impl/authority_resolver.hpp"
#include "dispute_distribution/types.hpp"
#include "log/logger.hpp"

namespace tribune::network {
  class DisputeRequestSender;
}

namespace tribune::dispute {

  /**
   * Delivery status for a particular dispute.
   *
   * Keeps track of all the validators that have to be reached for a dispute.
   * Not thread safe: the owner serializes all calls, and response-wait tasks
   * only talk back through the completion channel.
   */
  class SendTask final {
   public:
    SendTask(const SendTask &) = delete;
    SendTask &operator=(const SendTask &) = delete;

    /// Initiates sending a dispute message to peers.
    ///
    /// Fails if the initial `refresh_sends` fails.
    static outcome::result<std::unique_ptr<SendTask>> create(
        log::Logger log,
        std::shared_ptr<RuntimeInfo> runtime_info,
        std::shared_ptr<utils::TaskSpawner> spawner,
        std::shared_ptr<network::DisputeRequestSender> request_sender,
        CompletionSender tx,
        DisputeMessage request,
        const ActiveSessions &active_sessions);

    /// Make sure we are sending to all relevant authorities.
    ///
    /// This function is called at construction and should also be called
    /// whenever a session change happens and on a regular basis to ensure we
    /// are retrying failed attempts.
    ///
    /// Returns: `true` if this call resulted in new requests.
    outcome::result<bool> refresh_sends(const ActiveSessions &active_sessions);

    /// Whether any sends have failed since the last refresh.
    bool has_failed_sends() const {
      return has_failed_sends_;
    }

    /// Handle a finished response waiting task.
    void on_finished_send(const AuthorityDiscoveryId &authority,
                          TaskResult result);

    const DisputeMessage &request() const {
      return request_;
    }

    const CandidateHash &candidate_hash() const {
      return request_.candidate_hash;
    }

    const Deliveries &deliveries() const {
      return deliveries_;
    }

   private:
    SendTask(log::Logger log,
             std::shared_ptr<RuntimeInfo> runtime_info,
             std::shared_ptr<utils::TaskSpawner> spawner,
             std::shared_ptr<network::DisputeRequestSender> request_sender,
             CompletionSender tx,
             DisputeMessage request);

    log::Logger log_;
    AuthorityResolver resolver_;
    std::shared_ptr<utils::TaskSpawner> spawner_;
    std::shared_ptr<network::DisputeRequestSender> request_sender_;

    /// The request we are supposed to get out to all `parachain` validators of
    /// the dispute's session and to all current authorities.
    DisputeMessage request_;

    /// The set of authorities we need to send our messages to. This set will
    /// change at session boundaries. It will always be at least the `parachain`
    /// validators of the session where the dispute happened and the authorities
    /// of the current sessions as determined by active heads.
    Deliveries deliveries_;

    /// Whether we have any tasks failed since the last refresh.
    bool has_failed_sends_ = false;

    /// Sender to be cloned for tasks.
    CompletionSender tx_;
  };

}  // namespace tribune::dispute
