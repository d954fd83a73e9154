/**
 * @file snapshot.hpp
 * @brief ModelConfig <-> JSON key-value structure.
 *
 * @details
 * ```json
 * {
 *   "i_config": { "cfg_uap_ping": 4294967295, ... },
 *   "r_config": { "cfg_uap_ping": 4294967294, ... },
 *   "i_pairing_keys": { "0": { "value": "<64 hex digits>" }, ... },
 *   "s_t_priv": "<hex>", "s_t_pub": "<hex>",
 *   "x509_certificate": "<hex>", "chip_id": "<hex>",
 *   "riscv_fw_version": "<hex>", "spect_fw_version": "<hex>", "serial_code": "<hex>",
 *   "activate_encryption": true,
 *   "debug_random_value": "<hex>",
 *   "init_byte": 0,
 *   "busy_iter": [false, true]
 * }
 * ```
 * Every key is optional on input; a missing key keeps the ModelConfig
 * default, a missing register keeps 0xFFFFFFFF, a missing slot stays blank.
 * Output always carries every key.
 *
 * Errors come back as `<reason>:<key>` strings ("bad_type:r_config",
 * "bad_value:i_pairing_keys.7", "unknown_register:cfg_nope").
 */
#ifndef SECHIP_SNAPSHOT_HPP
#define SECHIP_SNAPSHOT_HPP

#include "sechip/model.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sechip {

nlohmann::json to_snapshot(const ModelConfig& config);

/// Fills @p out from @p j; on failure @p out is untouched and @p err says why.
bool from_snapshot(const nlohmann::json& j, ModelConfig& out, std::string& err);

} // namespace sechip

#endif // SECHIP_SNAPSHOT_HPP
