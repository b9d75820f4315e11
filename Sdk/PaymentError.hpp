#ifndef SDK_PAYMENTERROR_HPP
#define SDK_PAYMENTERROR_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Sdk {

/** class Sdk::PaymentError
 *
 * @brief the error every call-bridge entry point
 * fails with.
 *
 * @desc The kind is a closed set whose order fixes
 * the flat tag that crosses the call bridge.
 * Only `Generic`, `LwkError`, `Refunded`, `SendError`
 * and `SignerError` carry an `err` message, and only
 * `Refunded` carries a refund txid.
 */
class PaymentError : public Util::BacktraceException<std::runtime_error> {
public:
	enum class Kind
	{ AlreadyClaimed = 0
	, AmountOutOfRange = 1
	, Generic = 2
	, InvalidOrExpiredFees = 3
	, InsufficientFunds = 4
	, InvalidInvoice = 5
	, InvalidPreimage = 6
	, LwkError = 7
	, PairsNotFound = 8
	, PersistError = 9
	, Refunded = 10
	, SendError = 11
	, SignerError = 12
	};

private:
	Kind kind;
	std::string err;
	std::string refund_tx_id;

	PaymentError( Kind kind
		    , std::string err
		    , std::string refund_tx_id
		    );

public:
	Kind get_kind() const { return kind; }
	/* Empty for kinds without a message.  */
	std::string const& get_err() const { return err; }
	/* Empty unless the kind is `Refunded`.  */
	std::string const& get_refund_tx_id() const { return refund_tx_id; }

	static bool has_err(Kind k);
	static char const* kind_name(Kind k);

	std::uint32_t tag() const {
		return std::uint32_t(kind);
	}
	/** Sdk::PaymentError::from_tag
	 *
	 * @brief rebuild an error from its flat form.
	 * Payloads are dropped for kinds that do not
	 * carry them.
	 *
	 * @desc Throws `std::logic_error` on a tag
	 * outside the known range.
	 */
	static
	PaymentError from_tag( std::uint32_t tag
			     , std::string err = ""
			     , std::string refund_tx_id = ""
			     );

	static PaymentError already_claimed();
	static PaymentError amount_out_of_range();
	static PaymentError generic(std::string err);
	static PaymentError invalid_or_expired_fees();
	static PaymentError insufficient_funds();
	static PaymentError invalid_invoice();
	static PaymentError invalid_preimage();
	static PaymentError lwk_error(std::string err);
	static PaymentError pairs_not_found();
	static PaymentError persist_error();
	static PaymentError refunded( std::string err
				    , std::string refund_tx_id
				    );
	static PaymentError send_error(std::string err);
	static PaymentError signer_error(std::string err);
};

}

#endif /* !defined(SDK_PAYMENTERROR_HPP) */
