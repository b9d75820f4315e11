#include"Sdk/Config.hpp"

namespace {

Sdk::Config base(Sdk::Network n) {
	auto rv = Sdk::Config();
	rv.network = n;
	rv.electrum_tls = (n != Sdk::Network::Regtest);
	rv.electrum_validate_domain = rv.electrum_tls;
	rv.electrum_timeout = 3;
	rv.working_dir = ".";
	rv.scan_buffer = 5;
	rv.zero_conf_max_amount_sat = 100000;
	rv.fee_rate = 0.0;
	return rv;
}

std::string join(std::string const& dir, std::string const& name) {
	if (dir.empty())
		return name;
	if (dir[dir.size() - 1] == '/')
		return dir + name;
	return dir + "/" + name;
}

}

namespace Sdk {

char const* network_name(Network n) {
	switch (n) {
	case Network::Mainnet: return "mainnet";
	case Network::Testnet: return "testnet";
	case Network::Regtest: return "regtest";
	}
	return "unknown";
}

Config Config::mainnet() {
	auto rv = base(Network::Mainnet);
	rv.electrum_url = "elements-mainnet.breez.technology:50002";
	rv.policy_asset = "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d";
	return rv;
}
Config Config::testnet() {
	auto rv = base(Network::Testnet);
	rv.electrum_url = "blockstream.info:465";
	rv.policy_asset = "144c654344aa716d6f3abcc1ca90e5641e4e2a7f633bc09fe3baf64585819a49";
	return rv;
}
Config Config::regtest() {
	auto rv = base(Network::Regtest);
	rv.electrum_url = "localhost:19002";
	rv.policy_asset = "5ac9f65c0efcc4775e0baec4ec03abdde22473cd3cf33c0419ca290e0751b225";
	return rv;
}

std::string Config::storage_path() const {
	return join(working_dir, "storage.sql");
}
std::string Config::backup_path() const {
	return join(working_dir, "backup.sql");
}
std::string
Config::wallet_cache_dir(std::string const& fingerprint) const {
	return join(join(working_dir, "enc_cache"), fingerprint);
}

}
