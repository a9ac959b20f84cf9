/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "crypto/key_store.hpp"
#include "parachain/approval/approval.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace vigil::parachain::approval {

  /// Session parameters the assignment criteria depend on
  struct CriteriaConfig {
    /// The assignment public keys for validators.
    std::vector<runtime::AssignmentId> assignment_keys;
    /// The groups of validators assigned to each core.
    std::vector<std::vector<ValidatorIndex>> validator_groups;
    /// The number of availability cores used by the protocol during this
    /// session.
    uint32_t n_cores{};
    /// The zeroth delay tranche width.
    uint32_t zeroth_delay_tranche_width{};
    /// The number of samples we do of `relay_vrf_modulo`.
    uint32_t relay_vrf_modulo_samples{};
    /// The number of delay tranches in total.
    uint32_t n_delay_tranches{};

    static CriteriaConfig from(const runtime::SessionInfo &session_info) {
      return CriteriaConfig{
          .assignment_keys = session_info.assignment_keys,
          .validator_groups = session_info.validator_groups,
          .n_cores = session_info.n_cores,
          .zeroth_delay_tranche_width = session_info.zeroth_delay_tranche_width,
          .relay_vrf_modulo_samples = session_info.relay_vrf_modulo_samples,
          .n_delay_tranches = session_info.n_delay_tranches,
      };
    }

    bool operator==(const CriteriaConfig &) const = default;
  };

  using AssignmentsList = std::unordered_map<CoreIndex, OurAssignment>;

  /// Cores left by candidates included in a block, with their backing groups
  using LeavingCores = std::vector<std::pair<CoreIndex, GroupIndex>>;

  /**
   * Scoring of the local validator's approval-check assignments
   */
  class AssignmentCriteria {
   public:
    virtual ~AssignmentCriteria() = default;

    /**
     * Computes the assignments of the local validator for the cores left by
     * candidates of a block. Deterministic in its inputs.
     * @return assignments keyed by core, empty if the node has none
     */
    virtual AssignmentsList compute_assignments(
        const std::shared_ptr<crypto::KeyStore> &keystore,
        const RelayVRFStory &relay_vrf_story,
        const CriteriaConfig &config,
        const LeavingCores &leaving_cores) const = 0;
  };

}  // namespace vigil::parachain::approval
