#include "CauchyRxBlock.h"

#include <cstring>
#include <stdexcept>

#include "../HelperSources/Helper.hpp"
#include "gf256.h"

CauchyRxBlock::CauchyRxBlock(const rqharness::SourceBlockLayout &layout,
                             const uint16_t symbol_size)
    : m_layout(layout),
      m_symbol_size(symbol_size),
      m_symbol_map(rqharness::CAUCHY_MAX_SYMBOLS_PER_BLOCK, false),
      m_source_symbols(static_cast<std::size_t>(layout.n_source_symbols) *
                       symbol_size) {}

bool CauchyRxBlock::has_symbol(const uint32_t esi) const {
  if (esi > rqharness::CAUCHY_MAX_ESI) return false;
  return m_symbol_map[esi];
}

bool CauchyRxBlock::add_symbol(const uint32_t esi, const uint8_t *data) {
  if (esi > rqharness::CAUCHY_MAX_ESI) {
    throw std::out_of_range("ESI out of range for this block");
  }
  if (has_symbol(esi)) return false;
  m_symbol_map[esi] = true;
  if (esi < m_layout.n_source_symbols) {
    memcpy(m_source_symbols.data() + static_cast<std::size_t>(esi) *
                                         m_symbol_size,
           data, m_symbol_size);
    m_n_available_source_symbols++;
  } else {
    m_repair_esis.push_back(esi);
    m_repair_symbols.emplace_back(data, data + m_symbol_size);
  }
  return true;
}

bool CauchyRxBlock::can_be_reconstructed() const {
  return get_n_available_symbols() >=
         static_cast<int>(m_layout.n_source_symbols);
}

int CauchyRxBlock::reconstruct_missing_symbols() {
  if (!can_be_reconstructed()) {
    throw std::logic_error("Not enough symbols to reconstruct block");
  }
  const uint32_t k = m_layout.n_source_symbols;
  std::vector<unsigned int> available;
  for (unsigned int i = 0; i < k; i++) {
    if (m_symbol_map[i]) available.push_back(i);
  }
  const auto missing = rqharness::helper::findMissingIndices(available, k);
  const std::size_t m = missing.size();
  if (m == 0) return 0;
  const std::size_t t = m_symbol_size;
  // Take the first m repair symbols. For each of them, remove the
  // contribution of all source symbols we already have, leaving
  // residual_r = sum over missing c of C[r][c]*s_c
  std::vector<std::vector<uint8_t>> residuals(m);
  std::vector<std::vector<uint8_t>> matrix(m, std::vector<uint8_t>(m));
  for (std::size_t row = 0; row < m; row++) {
    const uint32_t esi = m_repair_esis[row];
    residuals[row] = m_repair_symbols[row];
    for (const auto idx : available) {
      rqharness::gf256::mul_add_region(
          residuals[row].data(), m_source_symbols.data() + idx * t,
          rqharness::cauchy_coefficient(esi, idx), t);
    }
    for (std::size_t col = 0; col < m; col++) {
      matrix[row][col] = rqharness::cauchy_coefficient(esi, missing[col]);
    }
  }
  // Gauss-Jordan elimination, applying every row operation to the residuals
  // as well. Afterwards residuals[c] holds the missing source symbol c.
  for (std::size_t col = 0; col < m; col++) {
    std::size_t pivot = col;
    while (pivot < m && matrix[pivot][col] == 0) pivot++;
    if (pivot == m) {
      // Cannot happen for a Cauchy matrix
      throw std::logic_error("Singular decoding matrix");
    }
    if (pivot != col) {
      std::swap(matrix[pivot], matrix[col]);
      std::swap(residuals[pivot], residuals[col]);
    }
    const uint8_t pivot_inv = rqharness::gf256::inv(matrix[col][col]);
    rqharness::gf256::mul_region(matrix[col].data(), pivot_inv, m);
    rqharness::gf256::mul_region(residuals[col].data(), pivot_inv, t);
    for (std::size_t row = 0; row < m; row++) {
      const uint8_t factor = matrix[row][col];
      if (row == col || factor == 0) continue;
      rqharness::gf256::mul_add_region(matrix[row].data(), matrix[col].data(),
                                       factor, m);
      rqharness::gf256::mul_add_region(residuals[row].data(),
                                       residuals[col].data(), factor, t);
    }
  }
  for (std::size_t c = 0; c < m; c++) {
    memcpy(m_source_symbols.data() + missing[c] * t, residuals[c].data(), t);
    m_symbol_map[missing[c]] = true;
  }
  m_n_available_source_symbols = k;
  return static_cast<int>(m);
}
