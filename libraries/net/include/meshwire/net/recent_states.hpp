#pragma once
#include <meshwire/net/frame.hpp>
#include <meshwire/net/message_type.hpp>
#include <meshwire/net/state_codec.hpp>
#include <meshwire/types/types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <vector>

namespace meshwire::net {

using account_states   = std::map< address_type, state_value >;
using block_states     = std::map< block_hash_type, account_states >;
using state_references = std::map< address_type, std::vector< block_hash_type > >;

/**
 * Reply to get_recent_states.
 *
 * Carries, for the requested block, the blocks at which each account's
 * state changed (its state reference trail, most recent last) and the
 * full account states for a subset of those blocks. The receiver rebuilds
 * the remaining states by replaying deltas along the trails.
 *
 * A node with no synced state for the block answers with a missing reply,
 * which carries the block hash only.
 *
 * Body layout:
 *
 *    [block_hash]
 *    [account_count]                       -1 when missing, nothing follows
 *    account_count times:
 *       [address] [k] [hash_0] ... [hash_k-1]
 *    [snapshot_count]
 *    snapshot_count times:
 *       [block_hash] [p] [address_0] [state_0] ... [address_p-1] [state_p-1]
 */
class recent_states
{
   public:
      static constexpr message_type type = message_type::recent_states;

      // Sentinel account count of a missing reply
      static constexpr int32_t missing_sentinel = -1;

      /**
       * A missing reply for block_hash.
       */
      explicit recent_states( const block_hash_type& block_hash );

      /**
       * Throws inconsistent_payload if a key of states is not referenced
       * by any trail in refs.
       */
      recent_states( const block_hash_type& block_hash, block_states states, state_references refs );

      const block_hash_type&  block_hash()const;
      bool                    missing()const;
      const block_states&     states()const;
      const state_references& references()const;

      frame_sequence to_frames( const state_codec& codec = cbor_state_codec() )const;
      static recent_states from_frames( const frame_sequence& body, const state_codec& codec = cbor_state_codec() );

      friend bool operator==( const recent_states& a, const recent_states& b )
      {
         return a._block_hash == b._block_hash
             && a._missing == b._missing
             && a._states == b._states
             && a._references == b._references;
      }

   private:
      void validate()const;

      block_hash_type  _block_hash;
      bool             _missing = false;
      block_states     _states;
      state_references _references;
};

void to_json( nlohmann::json& j, const recent_states& m );

} // meshwire::net
