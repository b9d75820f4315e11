#ifndef WALLET_MESSAGE_HPP
#define WALLET_MESSAGE_HPP

#include<string>

namespace Sha256 { class Hash; }
namespace Signer { class SdkSigner; }

namespace Wallet {

/* SHA256d of the Lightning message prefix followed
 * by the message.  */
Sha256::Hash message_hash(std::string const& msg);

/** Wallet::sign_message
 *
 * @brief sign with the master key, returning the
 * z-base-32 encoding of the 65-byte recoverable
 * signature.
 * Throws `Signer::SignerError`.
 */
std::string sign_message( Signer::SdkSigner& signer
			, std::string const& msg
			);

/** Wallet::check_message
 *
 * @brief whether the signature over the message
 * recovers to the given hex public key.
 * Malformed input of any kind yields false.
 */
bool check_message( std::string const& msg
		  , std::string const& pubkey
		  , std::string const& signature
		  );

}

#endif /* !defined(WALLET_MESSAGE_HPP) */
