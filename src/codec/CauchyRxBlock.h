#ifndef RQHARNESS_CAUCHY_RX_BLOCK_HPP
#define RQHARNESS_CAUCHY_RX_BLOCK_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "CauchyCodec.h"

// This encapsulates everything you need when working on a single source block
// on the receiver, for example add_symbol() or reconstruct_missing_symbols().
// It also provides convenient methods to query if the block is ready for the
// reconstruction step.
class CauchyRxBlock {
 public:
  CauchyRxBlock(const rqharness::SourceBlockLayout &layout,
                uint16_t symbol_size);
  // No copy constructor for safety
  CauchyRxBlock(const CauchyRxBlock &) = delete;
  ~CauchyRxBlock() = default;

 public:
  // returns true if this symbol has been already received
  bool has_symbol(uint32_t esi) const;
  // copy the symbol data and mark it as available. Returns false (and does
  // nothing) if the symbol is a duplicate.
  // @param data exactly symbol_size bytes
  bool add_symbol(uint32_t esi, const uint8_t *data);
  // returns true as soon as K distinct symbols (source or repair) are
  // available
  bool can_be_reconstructed() const;
  bool all_source_symbols_available() const {
    return m_n_available_source_symbols == m_layout.n_source_symbols;
  }
  /**
   * Reconstruct all missing source symbols by using the received repair
   * symbols. Requires can_be_reconstructed().
   * @return the n of reconstructed source symbols
   */
  int reconstruct_missing_symbols();
  // K*T bytes, only valid once all source symbols are available
  const std::vector<uint8_t> &get_source_symbols() const {
    return m_source_symbols;
  }
  const rqharness::SourceBlockLayout &get_layout() const { return m_layout; }
  int get_n_available_symbols() const {
    return m_n_available_source_symbols +
           static_cast<int>(m_repair_esis.size());
  }

 private:
  const rqharness::SourceBlockLayout m_layout;
  const uint16_t m_symbol_size;
  // for each ESI store if it has been received yet
  std::vector<bool> m_symbol_map;
  // storage for the source symbols. Content of a symbol is undefined as long
  // as m_symbol_map says it is unavailable
  std::vector<uint8_t> m_source_symbols;
  // received repair symbols, in order of arrival
  std::vector<uint32_t> m_repair_esis;
  std::vector<std::vector<uint8_t>> m_repair_symbols;
  uint32_t m_n_available_source_symbols = 0;
};

#endif  // RQHARNESS_CAUCHY_RX_BLOCK_HPP
