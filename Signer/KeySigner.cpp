#include"Bitcoin/hash160.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include"Signer/ExtPubKey.hpp"
#include"Signer/KeySigner.hpp"
#include"Util/make_unique.hpp"
#include<cstring>
#include<sodium/crypto_auth_hmacsha512.h>
#include<sodium/core.h>
#include<sodium/utils.h>

namespace {

std::uint32_t const hardened_bit = 0x80000000;

/* 64-byte HMAC-SHA512 output, wiped on destruction.  */
struct Hmac512 {
	std::uint8_t out[64];

	Hmac512( void const* key, std::size_t keylen
	       , std::vector<std::uint8_t> const& data
	       ) {
		auto st = crypto_auth_hmacsha512_state();
		crypto_auth_hmacsha512_init( &st
					   , (unsigned char const*) key
					   , keylen
					   );
		crypto_auth_hmacsha512_update(&st, data.data(), data.size());
		crypto_auth_hmacsha512_final(&st, out);
		sodium_memzero(&st, sizeof(st));
	}
	~Hmac512() {
		sodium_memzero(out, sizeof(out));
	}
};

void push_be32(std::vector<std::uint8_t>& v, std::uint32_t n) {
	v.push_back(std::uint8_t((n >> 24) & 0xFF));
	v.push_back(std::uint8_t((n >> 16) & 0xFF));
	v.push_back(std::uint8_t((n >> 8) & 0xFF));
	v.push_back(std::uint8_t((n >> 0) & 0xFF));
}

std::uint32_t fingerprint_of(Secp256k1::PubKey const& pk) {
	auto bytes = pk.to_bytes();
	auto h = Bitcoin::hash160(bytes.data(), bytes.size());
	return (std::uint32_t(h[0]) << 24)
	     | (std::uint32_t(h[1]) << 16)
	     | (std::uint32_t(h[2]) << 8)
	     | (std::uint32_t(h[3]) << 0)
	     ;
}

struct Node {
	Secp256k1::PrivKey key;
	std::uint8_t chain[32];
	std::uint8_t depth;
	std::uint32_t parent_fingerprint;
	std::uint32_t child_number;

	explicit
	Node(Secp256k1::PrivKey key_) : key(std::move(key_))
				      , depth(0)
				      , parent_fingerprint(0)
				      , child_number(0)
				      { }
	~Node() {
		sodium_memzero(chain, sizeof(chain));
	}

	Node child(std::uint32_t i) const {
		auto data = std::vector<std::uint8_t>();
		if (i & hardened_bit) {
			std::uint8_t k[32];
			key.to_buffer(k);
			data.push_back(0x00);
			data.insert(data.end(), k, k + 32);
			sodium_memzero(k, sizeof(k));
		} else {
			auto pk = Secp256k1::PubKey(key).to_bytes();
			data.insert(data.end(), pk.begin(), pk.end());
		}
		push_be32(data, i);

		auto I = Hmac512(chain, sizeof(chain), data);
		sodium_memzero(data.data(), data.size());

		auto rv = Node(key);
		rv.key.tweak_add(&I.out[0]);
		std::memcpy(rv.chain, &I.out[32], 32);
		rv.depth = depth + 1;
		rv.parent_fingerprint = fingerprint_of(Secp256k1::PubKey(key));
		rv.child_number = i;
		return rv;
	}
};

}

namespace Signer {

class KeySigner::Impl {
public:
	std::unique_ptr<Node> master;
	std::uint32_t version;
	std::uint8_t slip77[32];

	~Impl() {
		sodium_memzero(slip77, sizeof(slip77));
	}

	Node derive(std::string const& path) const {
		auto rv = *master;
		for (auto i : KeySigner::parse_path(path))
			rv = rv.child(i);
		return rv;
	}

	std::vector<std::uint8_t> xpub_of(Node const& n) const {
		return ExtPubKey::make( version
				      , n.depth
				      , n.parent_fingerprint
				      , n.child_number
				      , std::vector<std::uint8_t>( n.chain
								 , n.chain + 32
								 )
				      , Secp256k1::PubKey(n.key)
				      ).serialize();
	}
};

KeySigner::KeySigner( std::vector<std::uint8_t> const& seed
		    , bool mainnet
		    ) : pimpl(Util::make_unique<Impl>()) {
	if (sodium_init() < 0)
		throw SignerError("libsodium failed to initialize");
	if (seed.size() < 16 || seed.size() > 64)
		throw SignerError("Seed must be 16 to 64 bytes");

	pimpl->version = mainnet ? ExtPubKey::mainnet_version
				 : ExtPubKey::testnet_version
				 ;

	{
		static char const bip32_key[] = "Bitcoin seed";
		auto I = Hmac512(bip32_key, std::strlen(bip32_key), seed);
		try {
			pimpl->master = Util::make_unique<Node>(
				Secp256k1::PrivKey::from_buffer(&I.out[0])
			);
		} catch (Secp256k1::InvalidPrivKey const&) {
			throw SignerError("Seed yields an invalid master key");
		}
		std::memcpy(pimpl->master->chain, &I.out[32], 32);
	}

	/* SLIP21 node for label "SLIP-0077".  */
	{
		static char const slip21_key[] = "Symmetric key seed";
		auto root = Hmac512(slip21_key, std::strlen(slip21_key), seed);
		auto label = std::vector<std::uint8_t>{0x00};
		static char const slip77_label[] = "SLIP-0077";
		label.insert( label.end()
			    , slip77_label
			    , slip77_label + std::strlen(slip77_label)
			    );
		auto child = Hmac512(&root.out[0], 32, label);
		std::memcpy(pimpl->slip77, &child.out[32], 32);
	}
}

KeySigner::~KeySigner() =default;

std::vector<std::uint8_t> KeySigner::xpub() {
	return pimpl->xpub_of(*pimpl->master);
}

std::vector<std::uint8_t>
KeySigner::derive_xpub(std::string const& path) {
	return pimpl->xpub_of(pimpl->derive(path));
}

std::vector<std::uint8_t>
KeySigner::sign_ecdsa( std::vector<std::uint8_t> const& msg
		     , std::string const& path
		     ) {
	if (msg.size() != 32)
		throw SignerError("sign_ecdsa: message must be 32 bytes");
	auto node = pimpl->derive(path);
	auto m = Sha256::Hash::of_buffer(msg.data());
	return Secp256k1::Signature::create(node.key, m).der_encode();
}

std::vector<std::uint8_t>
KeySigner::sign_ecdsa_recoverable(std::vector<std::uint8_t> const& msg) {
	if (msg.size() != 32)
		throw SignerError("sign_ecdsa_recoverable: message must be 32 bytes");
	auto m = Sha256::Hash::of_buffer(msg.data());
	auto sig = Secp256k1::RecoverableSignature::create( pimpl->master->key
							  , m
							  );
	auto rv = std::vector<std::uint8_t>(65);
	auto recid = int(0);
	sig.to_compact(&rv[1], recid);
	rv[0] = std::uint8_t(31 + recid);
	return rv;
}

std::vector<std::uint8_t> KeySigner::slip77_master_blinding_key() {
	return std::vector<std::uint8_t>(pimpl->slip77, pimpl->slip77 + 32);
}

std::vector<std::uint32_t>
KeySigner::parse_path(std::string const& path) {
	auto rv = std::vector<std::uint32_t>();
	auto fail = [&path]() {
		return SignerError("Invalid derivation path: " + path);
	};

	auto i = std::size_t(0);
	if (path.size() >= 1 && path[0] == 'm') {
		i = 1;
		if (i == path.size())
			return rv;
		if (path[i] != '/')
			throw fail();
		++i;
	}
	if (i == path.size())
		throw fail();

	while (i < path.size()) {
		auto n = std::uint64_t(0);
		auto digits = std::size_t(0);
		while (i < path.size() && path[i] >= '0' && path[i] <= '9') {
			n = n * 10 + std::uint64_t(path[i] - '0');
			if (n >= hardened_bit)
				throw fail();
			++digits;
			++i;
		}
		if (digits == 0)
			throw fail();
		if (i < path.size() && (path[i] == '\'' || path[i] == 'h')) {
			n |= hardened_bit;
			++i;
		}
		rv.push_back(std::uint32_t(n));
		if (i == path.size())
			break;
		if (path[i] != '/' || i + 1 == path.size())
			throw fail();
		++i;
	}
	return rv;
}

}
