#include"Bitcoin/base58.hpp"
#include"Bitcoin/hash160.hpp"
#include"Signer/ExtPubKey.hpp"
#include"Signer/UserSignerIF.hpp"

namespace {

std::uint32_t read_be32(std::vector<std::uint8_t>::const_iterator p) {
	return (std::uint32_t(p[0]) << 24)
	     | (std::uint32_t(p[1]) << 16)
	     | (std::uint32_t(p[2]) << 8)
	     | std::uint32_t(p[3])
	     ;
}
void write_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
	out.push_back(std::uint8_t(v >> 24));
	out.push_back(std::uint8_t(v >> 16));
	out.push_back(std::uint8_t(v >> 8));
	out.push_back(std::uint8_t(v));
}

}

namespace Signer {

constexpr std::uint32_t ExtPubKey::mainnet_version;
constexpr std::uint32_t ExtPubKey::testnet_version;

ExtPubKey::ExtPubKey( std::uint32_t version_
		    , std::uint8_t depth_
		    , std::uint32_t parent_fingerprint_
		    , std::uint32_t child_number_
		    , std::vector<std::uint8_t> chain_code_
		    , Secp256k1::PubKey key_
		    ) : version(version_)
		      , depth(depth_)
		      , parent_fingerprint(parent_fingerprint_)
		      , child_number(child_number_)
		      , chain_code(std::move(chain_code_))
		      , key(std::move(key_))
		      { }

ExtPubKey ExtPubKey::parse(std::vector<std::uint8_t> const& b) {
	if (b.size() != 78)
		throw SignerError("Invalid xpub: expected 78 bytes");
	auto version = read_be32(b.begin());
	if (version != mainnet_version && version != testnet_version)
		throw SignerError("Invalid xpub: unknown version");
	try {
		return ExtPubKey( version
				, b[4]
				, read_be32(b.begin() + 5)
				, read_be32(b.begin() + 9)
				, std::vector<std::uint8_t>(b.begin() + 13, b.begin() + 45)
				, Secp256k1::PubKey::from_buffer(&b[45])
				);
	} catch (Secp256k1::InvalidPubKey const&) {
		throw SignerError("Invalid xpub: bad public key");
	}
}

ExtPubKey ExtPubKey::make( std::uint32_t version
			 , std::uint8_t depth
			 , std::uint32_t parent_fingerprint
			 , std::uint32_t child_number
			 , std::vector<std::uint8_t> chain_code
			 , Secp256k1::PubKey key
			 ) {
	return ExtPubKey( version, depth, parent_fingerprint, child_number
			, std::move(chain_code), std::move(key)
			);
}

std::vector<std::uint8_t> ExtPubKey::serialize() const {
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(78);
	write_be32(rv, version);
	rv.push_back(depth);
	write_be32(rv, parent_fingerprint);
	write_be32(rv, child_number);
	rv.insert(rv.end(), chain_code.begin(), chain_code.end());
	auto k = key.to_bytes();
	rv.insert(rv.end(), k.begin(), k.end());
	return rv;
}

std::string ExtPubKey::to_string() const {
	return Bitcoin::base58check_encode(serialize());
}

std::uint32_t ExtPubKey::fingerprint() const {
	auto k = key.to_bytes();
	auto h = Bitcoin::hash160(k.data(), k.size());
	return read_be32(h.begin());
}

}
