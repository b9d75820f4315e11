#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

#include<memory>

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 {
namespace Detail {

/* Shared so that the deleter stays hidden in the
 * control block, keeping secp256k1.h out of our
 * headers.
 */
extern std::shared_ptr<secp256k1_context_struct> const context;

}
}

#endif /* SECP256K1_DETAIL_CONTEXT_HPP */
