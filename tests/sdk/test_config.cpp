#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Sdk/Config.hpp"
#include"Sdk/PaymentError.hpp"
#include"Sdk/StreamLogger.hpp"
#include"Sdk/invoice.hpp"
#include"Util/Bech32.hpp"
#include<assert.h>
#include<sstream>

namespace {

/* A well-formed invoice with the given
 * human-readable part; tagged fields are not
 * looked at.  */
std::string make_invoice(std::string const& hrp) {
	auto values = std::vector<std::uint8_t>(7 + 104, 0);
	for (auto i = std::size_t(0); i < values.size(); ++i)
		values[i] = std::uint8_t(i % 32);
	return Util::Bech32::encode(Util::Bech32::Encoding::Bech32, hrp, values);
}

bool invalid_invoice(std::string const& invoice, Sdk::Network n) {
	try {
		Sdk::parse_invoice(invoice, n);
	} catch (Sdk::PaymentError const& e) {
		return e.get_kind() == Sdk::PaymentError::Kind::InvalidInvoice;
	}
	return false;
}

void test_config() {
	auto m = Sdk::Config::mainnet();
	assert(m.is_mainnet());
	assert(m.electrum_tls);
	assert(m.scan_buffer == 5);
	assert(m.policy_asset.size() == 64);

	auto r = Sdk::Config::regtest();
	assert(!r.is_mainnet());
	assert(!r.electrum_tls);
	assert(r.policy_asset != m.policy_asset);
	assert(std::string(Sdk::network_name(r.network)) == "regtest");

	r.working_dir = "/data/wallet/";
	assert(r.storage_path() == "/data/wallet/storage.sql");
	assert(r.backup_path() == "/data/wallet/backup.sql");
	assert(r.wallet_cache_dir("0badf00d") == "/data/wallet/enc_cache/0badf00d");
	r.working_dir = "/data";
	assert(r.storage_path() == "/data/storage.sql");
}

void test_invoice() {
	auto i = Sdk::parse_invoice(make_invoice("lnbcrt1m"), Sdk::Network::Regtest);
	assert(i.amount_sat == 100000);
	assert(i.network == Sdk::Network::Regtest);

	assert(Sdk::parse_invoice( make_invoice("lnbcrt2500u")
				 , Sdk::Network::Regtest
				 ).amount_sat == 250000);
	assert(Sdk::parse_invoice( make_invoice("lnbcrt10n")
				 , Sdk::Network::Regtest
				 ).amount_sat == 1);
	assert(Sdk::parse_invoice( make_invoice("lnbc20m")
				 , Sdk::Network::Mainnet
				 ).amount_sat == 2000000);
	assert(Sdk::parse_invoice( make_invoice("lntb1")
				 , Sdk::Network::Testnet
				 ).amount_sat == 100000000);

	/* No amount.  */
	assert(invalid_invoice(make_invoice("lnbcrt"), Sdk::Network::Regtest));
	/* Another network.  */
	assert(invalid_invoice(make_invoice("lnbc1m"), Sdk::Network::Regtest));
	assert(invalid_invoice(make_invoice("lnbcrt1m"), Sdk::Network::Mainnet));
	/* Sub-millisatoshi.  */
	assert(invalid_invoice(make_invoice("lnbcrt1p"), Sdk::Network::Regtest));
	assert(invalid_invoice(make_invoice("lnbcrt1x"), Sdk::Network::Regtest));
	assert(invalid_invoice(make_invoice("lnxx1m"), Sdk::Network::Regtest));

	auto broken = make_invoice("lnbcrt1m");
	broken[broken.size() - 1] = broken[broken.size() - 1] == 'q' ? 'p' : 'q';
	assert(invalid_invoice(broken, Sdk::Network::Regtest));

	auto too_short = Util::Bech32::encode( Util::Bech32::Encoding::Bech32
					     , "lnbcrt1m"
					     , std::vector<std::uint8_t>(10, 0)
					     );
	assert(invalid_invoice(too_short, Sdk::Network::Regtest));
	assert(invalid_invoice("", Sdk::Network::Regtest));
}

}

int main() {
	test_config();
	test_invoice();

	auto os = std::ostringstream();
	auto logger = Sdk::StreamLogger(os, Sdk::Info);
	auto code = Sdk::log(logger, Sdk::Debug, "hidden %d", 1)
		  + Sdk::log(logger, Sdk::Info, "shown %d", 2)
		  + Sdk::log(logger, Sdk::Error, "failed: %s", "oops")
		  + Ev::lift().then([&os]() {
		assert(os.str() == "info shown 2\nerror failed: oops\n");
		return Ev::lift(0);
	});
	return Ev::start(std::move(code));
}
