#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Bitcoin/base58.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<iterator>

namespace {

struct HrpInfo {
	char const* hrp;
	Bitcoin::Chain chain;
	Bitcoin::Net net;
	bool confidential;
};
HrpInfo const hrps[] =
{ {"bc", Bitcoin::Chain::Bitcoin, Bitcoin::Net::Main, false}
, {"tb", Bitcoin::Chain::Bitcoin, Bitcoin::Net::Test, false}
, {"bcrt", Bitcoin::Chain::Bitcoin, Bitcoin::Net::Regtest, false}
, {"ex", Bitcoin::Chain::Liquid, Bitcoin::Net::Main, false}
, {"tex", Bitcoin::Chain::Liquid, Bitcoin::Net::Test, false}
, {"ert", Bitcoin::Chain::Liquid, Bitcoin::Net::Regtest, false}
, {"lq", Bitcoin::Chain::Liquid, Bitcoin::Net::Main, true}
, {"tlq", Bitcoin::Chain::Liquid, Bitcoin::Net::Test, true}
, {"el", Bitcoin::Chain::Liquid, Bitcoin::Net::Regtest, true}
};

enum class Base58Kind { P2PKH, P2SH, Blinded };
struct Base58Prefix {
	std::uint8_t prefix;
	Bitcoin::Chain chain;
	Bitcoin::Net net;
	Base58Kind kind;
};
Base58Prefix const base58_prefixes[] =
{ {0x00, Bitcoin::Chain::Bitcoin, Bitcoin::Net::Main, Base58Kind::P2PKH}
, {0x05, Bitcoin::Chain::Bitcoin, Bitcoin::Net::Main, Base58Kind::P2SH}
, {0x6f, Bitcoin::Chain::Bitcoin, Bitcoin::Net::Test, Base58Kind::P2PKH}
, {0xc4, Bitcoin::Chain::Bitcoin, Bitcoin::Net::Test, Base58Kind::P2SH}
, {57, Bitcoin::Chain::Liquid, Bitcoin::Net::Main, Base58Kind::P2PKH}
, {39, Bitcoin::Chain::Liquid, Bitcoin::Net::Main, Base58Kind::P2SH}
, {12, Bitcoin::Chain::Liquid, Bitcoin::Net::Main, Base58Kind::Blinded}
, {36, Bitcoin::Chain::Liquid, Bitcoin::Net::Test, Base58Kind::P2PKH}
, {19, Bitcoin::Chain::Liquid, Bitcoin::Net::Test, Base58Kind::P2SH}
, {23, Bitcoin::Chain::Liquid, Bitcoin::Net::Test, Base58Kind::Blinded}
, {235, Bitcoin::Chain::Liquid, Bitcoin::Net::Regtest, Base58Kind::P2PKH}
, {75, Bitcoin::Chain::Liquid, Bitcoin::Net::Regtest, Base58Kind::P2SH}
, {4, Bitcoin::Chain::Liquid, Bitcoin::Net::Regtest, Base58Kind::Blinded}
};

std::vector<std::uint8_t>
hash_script(Base58Kind kind, std::vector<std::uint8_t>::const_iterator hash) {
	auto rv = std::vector<std::uint8_t>();
	if (kind == Base58Kind::P2PKH) {
		/* OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG */
		rv = {0x76, 0xa9, 0x14};
		rv.insert(rv.end(), hash, hash + 20);
		rv.push_back(0x88);
		rv.push_back(0xac);
	} else {
		/* OP_HASH160 <20> OP_EQUAL */
		rv = {0xa9, 0x14};
		rv.insert(rv.end(), hash, hash + 20);
		rv.push_back(0x87);
	}
	return rv;
}

Bitcoin::Address
parse_base58(std::string const& addr) {
	auto payload = std::vector<std::uint8_t>();
	if (!Bitcoin::base58check_decode(payload, addr) || payload.empty())
		throw Bitcoin::UnknownAddrType(addr);

	auto it = std::find_if( std::begin(base58_prefixes)
			      , std::end(base58_prefixes)
			      , [&payload](Base58Prefix const& p) {
		return p.prefix == payload[0];
	});
	if (it == std::end(base58_prefixes))
		throw Bitcoin::UnknownAddrType(addr);

	auto rv = Bitcoin::Address{it->chain, it->net, false, {}, {}};
	if (it->kind != Base58Kind::Blinded) {
		if (payload.size() != 21)
			throw Bitcoin::UnknownAddrType(addr);
		rv.script_pubkey = hash_script(it->kind, payload.begin() + 1);
		return rv;
	}

	/* prefix, inner version, blinding key, hash.  */
	if (payload.size() != 1 + 1 + 33 + 20)
		throw Bitcoin::UnknownAddrType(addr);
	auto inner = std::find_if( std::begin(base58_prefixes)
				 , std::end(base58_prefixes)
				 , [&payload, it](Base58Prefix const& p) {
		return p.prefix == payload[1]
		    && p.chain == it->chain
		    && p.net == it->net
		    && p.kind != Base58Kind::Blinded
		     ;
	});
	if (inner == std::end(base58_prefixes))
		throw Bitcoin::UnknownAddrType(addr);
	rv.blinding_pubkey.assign(payload.begin() + 2, payload.begin() + 35);
	rv.script_pubkey = hash_script(inner->kind, payload.begin() + 35);
	return rv;
}

}

namespace Bitcoin {

Address parse_address(std::string const& addr) {
	auto decoded = Util::Bech32::decode(addr);
	if (decoded.encoding == Util::Bech32::Encoding::Invalid)
		return parse_base58(addr);

	auto info = std::find_if( std::begin(hrps), std::end(hrps)
				, [&decoded](HrpInfo const& h) {
		return decoded.hrp == h.hrp;
	});
	if (info == std::end(hrps))
		throw UnknownAddrType(addr);

	auto blech = decoded.encoding == Util::Bech32::Encoding::Blech32
		  || decoded.encoding == Util::Bech32::Encoding::Blech32m
		   ;
	if (blech != info->confidential)
		throw UnknownAddrType(addr);

	if (decoded.data.empty())
		throw UnknownAddrType(addr);
	auto version = decoded.data[0];
	if (version > 16)
		throw UnknownAddrType(addr);

	/* Version 0 uses the original checksum constant,
	 * later versions the "m" variant.  */
	auto modern = decoded.encoding == Util::Bech32::Encoding::Bech32m
		   || decoded.encoding == Util::Bech32::Encoding::Blech32m
		    ;
	if ((version == 0) == modern)
		throw UnknownAddrType(addr);

	auto program = std::vector<std::uint8_t>();
	auto values = std::vector<std::uint8_t>( decoded.data.begin() + 1
					       , decoded.data.end()
					       );
	if (!Util::Bech32::convert_bits(program, values, 5, 8, false))
		throw UnknownAddrType(addr);

	auto rv = Address{info->chain, info->net, true, {}, {}};
	if (info->confidential) {
		if (program.size() < 33)
			throw UnknownAddrType(addr);
		rv.blinding_pubkey.assign(program.begin(), program.begin() + 33);
		program.erase(program.begin(), program.begin() + 33);
	}

	/* From 2 to 40 bytes as per BIP-173.  */
	if (program.size() < 2 || program.size() > 40)
		throw UnknownAddrType(addr);
	if (version == 0 && program.size() != 20 && program.size() != 32)
		throw UnknownAddrType(addr);

	rv.script_pubkey.push_back(version == 0 ? 0x00 : (0x50 + version));
	rv.script_pubkey.push_back(std::uint8_t(program.size()));
	rv.script_pubkey.insert( rv.script_pubkey.end()
			       , program.begin(), program.end()
			       );
	return rv;
}

std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const& addr) {
	return parse_address(addr).script_pubkey;
}

bool is_address_for(std::string const& addr, Chain chain, Net net) {
	try {
		auto parsed = parse_address(addr);
		if (parsed.chain != chain)
			return false;
		if (parsed.net == net)
			return true;
		/* Legacy Bitcoin test addresses serve regtest too.  */
		return !parsed.segwit
		    && chain == Chain::Bitcoin
		    && parsed.net == Net::Test
		    && net == Net::Regtest
		     ;
	} catch (UnknownAddrType const&) {
		return false;
	}
}

}
