#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>
#include<string>
#include<vector>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief object that lets you stream bytes
 * to be fed to the hasher, then generate
 * the hash of all the bytes streamed in.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	~Hasher();

	Hasher& operator=(Hasher&&);

	/* Is it still valid, or has it been finalized?  */
	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	void feed(void const* p, std::size_t size);
	void feed(std::string const& s) {
		feed(s.data(), s.size());
	}
	void feed(std::vector<std::uint8_t> const& v) {
		feed(v.data(), v.size());
	}

	Sha256::Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
