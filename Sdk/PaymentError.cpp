#include"Sdk/PaymentError.hpp"

namespace {

std::string describe( Sdk::PaymentError::Kind k
		    , std::string const& err
		    ) {
	auto rv = std::string(Sdk::PaymentError::kind_name(k));
	if (!err.empty())
		rv += ": " + err;
	return rv;
}

}

namespace Sdk {

PaymentError::PaymentError( Kind kind_
			  , std::string err_
			  , std::string refund_tx_id_
			  ) : Util::BacktraceException<std::runtime_error>(
				describe(kind_, err_)
			    )
			    , kind(kind_)
			    , err(std::move(err_))
			    , refund_tx_id(std::move(refund_tx_id_))
			    { }

bool PaymentError::has_err(Kind k) {
	switch (k) {
	case Kind::Generic:
	case Kind::LwkError:
	case Kind::Refunded:
	case Kind::SendError:
	case Kind::SignerError:
		return true;
	case Kind::AlreadyClaimed:
	case Kind::AmountOutOfRange:
	case Kind::InvalidOrExpiredFees:
	case Kind::InsufficientFunds:
	case Kind::InvalidInvoice:
	case Kind::InvalidPreimage:
	case Kind::PairsNotFound:
	case Kind::PersistError:
		return false;
	}
	return false;
}

char const* PaymentError::kind_name(Kind k) {
	switch (k) {
	case Kind::AlreadyClaimed: return "AlreadyClaimed";
	case Kind::AmountOutOfRange: return "AmountOutOfRange";
	case Kind::Generic: return "Generic";
	case Kind::InvalidOrExpiredFees: return "InvalidOrExpiredFees";
	case Kind::InsufficientFunds: return "InsufficientFunds";
	case Kind::InvalidInvoice: return "InvalidInvoice";
	case Kind::InvalidPreimage: return "InvalidPreimage";
	case Kind::LwkError: return "LwkError";
	case Kind::PairsNotFound: return "PairsNotFound";
	case Kind::PersistError: return "PersistError";
	case Kind::Refunded: return "Refunded";
	case Kind::SendError: return "SendError";
	case Kind::SignerError: return "SignerError";
	}
	return "Unknown";
}

PaymentError PaymentError::from_tag( std::uint32_t tag
				   , std::string err
				   , std::string refund_tx_id
				   ) {
	if (tag > std::uint32_t(Kind::SignerError))
		throw std::logic_error(
			"PaymentError: unknown tag " + std::to_string(tag)
		);
	auto k = Kind(tag);
	if (!has_err(k))
		err.clear();
	if (k != Kind::Refunded)
		refund_tx_id.clear();
	return PaymentError(k, std::move(err), std::move(refund_tx_id));
}

PaymentError PaymentError::already_claimed() {
	return PaymentError(Kind::AlreadyClaimed, "", "");
}
PaymentError PaymentError::amount_out_of_range() {
	return PaymentError(Kind::AmountOutOfRange, "", "");
}
PaymentError PaymentError::generic(std::string err) {
	return PaymentError(Kind::Generic, std::move(err), "");
}
PaymentError PaymentError::invalid_or_expired_fees() {
	return PaymentError(Kind::InvalidOrExpiredFees, "", "");
}
PaymentError PaymentError::insufficient_funds() {
	return PaymentError(Kind::InsufficientFunds, "", "");
}
PaymentError PaymentError::invalid_invoice() {
	return PaymentError(Kind::InvalidInvoice, "", "");
}
PaymentError PaymentError::invalid_preimage() {
	return PaymentError(Kind::InvalidPreimage, "", "");
}
PaymentError PaymentError::lwk_error(std::string err) {
	return PaymentError(Kind::LwkError, std::move(err), "");
}
PaymentError PaymentError::pairs_not_found() {
	return PaymentError(Kind::PairsNotFound, "", "");
}
PaymentError PaymentError::persist_error() {
	return PaymentError(Kind::PersistError, "", "");
}
PaymentError PaymentError::refunded( std::string err
				   , std::string refund_tx_id
				   ) {
	return PaymentError( Kind::Refunded
			   , std::move(err)
			   , std::move(refund_tx_id)
			   );
}
PaymentError PaymentError::send_error(std::string err) {
	return PaymentError(Kind::SendError, std::move(err), "");
}
PaymentError PaymentError::signer_error(std::string err) {
	return PaymentError(Kind::SignerError, std::move(err), "");
}

}
