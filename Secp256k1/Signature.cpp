#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<secp256k1.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace {

secp256k1_ecdsa_signature* raw(std::uint8_t* data) {
	return reinterpret_cast<secp256k1_ecdsa_signature*>(data);
}
secp256k1_ecdsa_signature const* raw(std::uint8_t const* data) {
	return reinterpret_cast<secp256k1_ecdsa_signature const*>(data);
}

}

namespace Secp256k1 {

Signature::Signature() {
	memset(data, 0, sizeof(data));
}

Signature::Signature( Secp256k1::PrivKey const& sk
		    , Sha256::Hash const& m
		    ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	std::uint8_t extra_entropy[32] = { 0 };
	auto counter = std::uint32_t(0);

	do {
		auto res = secp256k1_ecdsa_sign
			( context.get()
			, raw(data)
			, mbuf
			, sk.key
			, nullptr
			, counter == 0 ? nullptr : extra_entropy
			);
		if (res == 0)
			throw Util::BacktraceException<std::runtime_error>(
				"Secp256k1::Signature: nonce generation failed."
			);
		++counter;
		memcpy(extra_entropy, &counter, sizeof(counter));
	} while (!sig_has_low_r());
}

bool Signature::sig_has_low_r() const {
	/* Bitcoin relay policy favors low-R signatures,
	 * which are one byte shorter in DER.
	 */
	unsigned char compact_sig[64];
	secp256k1_ecdsa_signature_serialize_compact
		(context.get(), compact_sig, raw(data));
	return compact_sig[0] < 0x80;
}

Signature Signature::from_buffer(std::uint8_t const buffer[64]) {
	auto rv = Signature();
	auto res = secp256k1_ecdsa_signature_parse_compact
		(context.get(), raw(rv.data), buffer);
	if (res == 0)
		throw BadSignatureEncoding();
	secp256k1_ecdsa_signature_normalize
		(context.get(), raw(rv.data), raw(rv.data));
	return rv;
}

void Signature::to_buffer(std::uint8_t buffer[64]) const {
	auto res = secp256k1_ecdsa_signature_serialize_compact
		(context.get(), buffer, raw(data));
	assert(res == 1);
	(void) res;
}

bool Signature::valid( Secp256k1::PubKey const& pk
		     , Sha256::Hash const& m
		     ) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto res = secp256k1_ecdsa_verify
		( context.get()
		, raw(data)
		, mbuf
		, reinterpret_cast<const secp256k1_pubkey*>(pk.get_key())
		);
	return res != 0;
}

std::vector<std::uint8_t>
Signature::der_encode() const {
	/* DER-encoded ECDSA signatures are at most 72 bytes.  */
	auto rv = std::vector<std::uint8_t>(72);
	auto len = rv.size();
	auto res = secp256k1_ecdsa_signature_serialize_der
		(context.get(), &rv[0], &len, raw(data));
	assert(res == 1);
	(void) res;
	rv.resize(len);
	return rv;
}

Signature
Signature::der_decode(std::vector<std::uint8_t> const& d) {
	auto rv = Signature();
	if (d.empty())
		throw BadSignatureEncoding();
	auto res = secp256k1_ecdsa_signature_parse_der
		(context.get(), raw(rv.data), &d[0], d.size());
	if (res == 0)
		throw BadSignatureEncoding();
	return rv;
}

}
