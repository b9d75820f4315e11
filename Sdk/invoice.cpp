#include"Sdk/PaymentError.hpp"
#include"Sdk/invoice.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<cctype>

namespace {

/* Timestamp plus signature, in 5-bit groups.  */
auto const min_data_len = std::size_t(7 + 104);

/* Longest first: "bcrt" also starts with "bc".  */
struct Currency {
	char const* prefix;
	Sdk::Network network;
};
Currency const currencies[] =
{ {"bcrt", Sdk::Network::Regtest}
, {"bc", Sdk::Network::Mainnet}
, {"tb", Sdk::Network::Testnet}
};

std::uint64_t parse_amount_msat(std::string const& s) {
	if (s.empty())
		throw Sdk::PaymentError::invalid_invoice();

	auto digits = s;
	auto multiplier = char(0);
	if (!std::isdigit((unsigned char) s.back())) {
		multiplier = s.back();
		digits.pop_back();
	}
	if (digits.empty() || digits.size() > 15 || digits[0] == '0')
		throw Sdk::PaymentError::invalid_invoice();
	auto n = std::uint64_t(0);
	for (auto c : digits) {
		if (!std::isdigit((unsigned char) c))
			throw Sdk::PaymentError::invalid_invoice();
		n = n * 10 + std::uint64_t(c - '0');
	}

	switch (multiplier) {
	case 0: return n * 100000000000ULL;
	case 'm': return n * 100000000ULL;
	case 'u': return n * 100000ULL;
	case 'n': return n * 100ULL;
	case 'p':
		if (n % 10 != 0)
			throw Sdk::PaymentError::invalid_invoice();
		return n / 10;
	}
	throw Sdk::PaymentError::invalid_invoice();
}

}

namespace Sdk {

Invoice parse_invoice(std::string const& invoice, Network expected) {
	auto decoded = Util::Bech32::decode(invoice, false);
	if (decoded.encoding != Util::Bech32::Encoding::Bech32)
		throw PaymentError::invalid_invoice();
	if (decoded.data.size() < min_data_len)
		throw PaymentError::invalid_invoice();

	auto const& hrp = decoded.hrp;
	if (hrp.size() < 2 || hrp.compare(0, 2, "ln") != 0)
		throw PaymentError::invalid_invoice();
	auto rest = hrp.substr(2);

	auto found = std::find_if( std::begin(currencies), std::end(currencies)
				 , [&rest](Currency const& c) {
		return rest.compare(0, std::string(c.prefix).size(), c.prefix) == 0;
	});
	if (found == std::end(currencies))
		throw PaymentError::invalid_invoice();
	if (found->network != expected)
		throw PaymentError::invalid_invoice();

	auto msat = parse_amount_msat(rest.substr(std::string(found->prefix).size()));

	auto rv = Invoice();
	rv.invoice = invoice;
	rv.network = found->network;
	rv.amount_sat = msat / 1000;
	return rv;
}

}
