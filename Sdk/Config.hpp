#ifndef SDK_CONFIG_HPP
#define SDK_CONFIG_HPP

#include<cstdint>
#include<string>

namespace Sdk {

enum class Network {
	Mainnet,
	Testnet,
	Regtest
};

char const* network_name(Network n);

/** struct Sdk::Config
 *
 * @brief settings of one wallet instance.
 *
 * @desc Use one of the per-network factories and
 * then adjust fields; the factories fill in the
 * defaults of each network.
 */
struct Config {
	Network network;

	/* Electrum server, `host:port`.  */
	std::string electrum_url;
	bool electrum_tls;
	bool electrum_validate_domain;
	/* Seconds.  */
	std::uint32_t electrum_timeout;

	/* Directory holding the store and the wallet cache.  */
	std::string working_dir;

	/* Native asset id, hex.  */
	std::string policy_asset;

	/* Indices scanned beyond the last known
	 * derivation index.  */
	std::uint32_t scan_buffer;

	/* Largest incoming amount accepted with zero
	 * confirmations.  */
	std::uint64_t zero_conf_max_amount_sat;

	/* sat/vbyte; 0 lets the wallet pick.  */
	double fee_rate;

	static Config mainnet();
	static Config testnet();
	static Config regtest();

	bool is_mainnet() const { return network == Network::Mainnet; }

	/* `<working_dir>/storage.sql`.  */
	std::string storage_path() const;
	/* `<working_dir>/backup.sql`.  */
	std::string backup_path() const;
	/* `<working_dir>/enc_cache/<fingerprint>`.  */
	std::string wallet_cache_dir(std::string const& fingerprint) const;
};

}

#endif /* !defined(SDK_CONFIG_HPP) */
