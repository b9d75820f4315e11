#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<secp256k1.h>
#include<secp256k1_recovery.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace {

secp256k1_ecdsa_recoverable_signature* raw(std::uint8_t* data) {
	return reinterpret_cast<secp256k1_ecdsa_recoverable_signature*>(data);
}
secp256k1_ecdsa_recoverable_signature const* raw(std::uint8_t const* data) {
	return reinterpret_cast<secp256k1_ecdsa_recoverable_signature const*>(data);
}

}

namespace Secp256k1 {

RecoverableSignature::RecoverableSignature() {
	memset(data, 0, sizeof(data));
}

RecoverableSignature
RecoverableSignature::create( Secp256k1::PrivKey const& sk
			    , Sha256::Hash const& m
			    ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto rv = RecoverableSignature();
	auto res = secp256k1_ecdsa_sign_recoverable
		( context.get()
		, raw(rv.data)
		, mbuf
		, sk.key
		, nullptr
		, nullptr
		);
	if (res == 0)
		throw Util::BacktraceException<std::runtime_error>(
			"Secp256k1::RecoverableSignature: signing failed."
		);
	return rv;
}

RecoverableSignature
RecoverableSignature::from_compact( std::uint8_t const compact[64]
				  , int recid
				  ) {
	if (recid < 0 || recid > 3)
		throw BadSignatureEncoding();
	auto rv = RecoverableSignature();
	auto res = secp256k1_ecdsa_recoverable_signature_parse_compact
		(context.get(), raw(rv.data), compact, recid);
	if (res == 0)
		throw BadSignatureEncoding();
	return rv;
}

void RecoverableSignature::to_compact( std::uint8_t compact[64]
				     , int& recid
				     ) const {
	auto res = secp256k1_ecdsa_recoverable_signature_serialize_compact
		(context.get(), compact, &recid, raw(data));
	assert(res == 1);
	(void) res;
}

Secp256k1::PubKey
RecoverableSignature::recover(Sha256::Hash const& m) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto rv = PubKey();
	auto res = secp256k1_ecdsa_recover
		( context.get()
		, reinterpret_cast<secp256k1_pubkey*>(rv.get_key())
		, raw(data)
		, mbuf
		);
	if (res == 0)
		throw InvalidPubKey();
	return rv;
}

}
