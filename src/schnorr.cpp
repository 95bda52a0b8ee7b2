#include "schnorr.hpp"

#include <array>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include "utils.hpp"

namespace schnorr
{

namespace
{

using Bytes = std::vector<unsigned char>;

struct BNDeleter
{
    void operator()(BIGNUM* p) const { BN_free(p); }
};
struct BNCtxDeleter
{
    void operator()(BN_CTX* p) const { BN_CTX_free(p); }
};
struct PointDeleter
{
    void operator()(EC_POINT* p) const { EC_POINT_free(p); }
};
struct GroupDeleter
{
    void operator()(EC_GROUP* p) const { EC_GROUP_free(p); }
};

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

// The curve and its constants, set up once for the process.
struct Curve
{
    std::unique_ptr<EC_GROUP, GroupDeleter> group;
    BNPtr p;
    BNPtr n;

    Curve()
        : group(EC_GROUP_new_by_curve_name(NID_secp256k1)), p(BN_new()),
          n(BN_new())
    {
        if(group)
        {
            EC_GROUP_get_curve(group.get(), p.get(), nullptr, nullptr,
                               nullptr);
            EC_GROUP_get_order(group.get(), n.get(), nullptr);
        }
    }
};

const Curve& curve()
{
    static const Curve c;
    return c;
}

BNPtr bnFromBytes(const unsigned char* data, size_t len)
{
    return BNPtr(BN_bin2bn(data, static_cast<int>(len), nullptr));
}

Bytes bnToBytes(const BIGNUM* bn)
{
    Bytes out(32);
    BN_bn2binpad(bn, out.data(), 32);
    return out;
}

Bytes sha256(const Bytes& data)
{
    Bytes out(32);
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(),
               nullptr);
    return out;
}

Bytes taggedHash(std::string_view tag, const Bytes& msg)
{
    Bytes tag_hash = sha256(Bytes(tag.begin(), tag.end()));
    Bytes buf;
    buf.reserve(64 + msg.size());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), msg.begin(), msg.end());
    return sha256(buf);
}

Bytes concat(std::initializer_list<const Bytes*> parts)
{
    Bytes out;
    for(const Bytes* p : parts)
    {
        out.insert(out.end(), p->begin(), p->end());
    }
    return out;
}

// x coordinate and y parity of a point.
bool pointCoordinates(const EC_POINT* pt, BIGNUM* x, bool& even_y,
                      BN_CTX* ctx)
{
    BNPtr y(BN_new());
    if(EC_POINT_get_affine_coordinates(curve().group.get(), pt, x, y.get(),
                                       ctx) != 1)
    {
        return false;
    }
    even_y = !BN_is_odd(y.get());
    return true;
}

// The point with the given x coordinate and an even y.
PointPtr liftX(const Bytes& x_bytes, BN_CTX* ctx)
{
    BNPtr x = bnFromBytes(x_bytes.data(), x_bytes.size());
    if(!x || BN_cmp(x.get(), curve().p.get()) >= 0)
    {
        return nullptr;
    }
    PointPtr pt(EC_POINT_new(curve().group.get()));
    if(EC_POINT_set_compressed_coordinates(curve().group.get(), pt.get(),
                                           x.get(), 0, ctx) != 1)
    {
        return nullptr;
    }
    return pt;
}

E<BNPtr> secretScalar(std::string_view secret_hex)
{
    auto bytes = hexDecode(secret_hex);
    if(!bytes.has_value() || bytes->size() != 32)
    {
        return std::unexpected(invalidInput("Secret key must be 32 bytes"));
    }
    BNPtr d = bnFromBytes(bytes->data(), bytes->size());
    if(BN_is_zero(d.get()) || BN_cmp(d.get(), curve().n.get()) >= 0)
    {
        return std::unexpected(invalidInput("Secret key out of range"));
    }
    return d;
}

} // namespace

E<std::string> publicKeyFor(std::string_view secret_hex)
{
    if(!curve().group)
    {
        return std::unexpected(internalError("secp256k1 is not available"));
    }
    ASSIGN_OR_RETURN(BNPtr d, secretScalar(secret_hex));
    BNCtxPtr ctx(BN_CTX_new());
    PointPtr pt(EC_POINT_new(curve().group.get()));
    if(EC_POINT_mul(curve().group.get(), pt.get(), d.get(), nullptr, nullptr,
                    ctx.get()) != 1)
    {
        return std::unexpected(internalError("Point multiplication failed"));
    }
    BNPtr x(BN_new());
    bool even_y = true;
    if(!pointCoordinates(pt.get(), x.get(), even_y, ctx.get()))
    {
        return std::unexpected(internalError("Invalid public point"));
    }
    return hexEncode(bnToBytes(x.get()));
}

E<std::string> sign(std::string_view secret_hex, std::string_view msg_hex,
                    const std::vector<unsigned char>& aux)
{
    if(!curve().group)
    {
        return std::unexpected(internalError("secp256k1 is not available"));
    }
    auto msg = hexDecode(msg_hex);
    if(!msg.has_value() || msg->size() != 32)
    {
        return std::unexpected(invalidInput("Message must be 32 bytes"));
    }
    Bytes aux_bytes = aux;
    if(aux_bytes.empty())
    {
        aux_bytes.resize(32);
        if(RAND_bytes(aux_bytes.data(), 32) != 1)
        {
            return std::unexpected(internalError("RAND_bytes failed"));
        }
    }

    const EC_GROUP* group = curve().group.get();
    const BIGNUM* n = curve().n.get();
    BNCtxPtr ctx(BN_CTX_new());

    ASSIGN_OR_RETURN(BNPtr d, secretScalar(secret_hex));
    PointPtr p_pt(EC_POINT_new(group));
    EC_POINT_mul(group, p_pt.get(), d.get(), nullptr, nullptr, ctx.get());
    BNPtr px(BN_new());
    bool even_y = true;
    if(!pointCoordinates(p_pt.get(), px.get(), even_y, ctx.get()))
    {
        return std::unexpected(internalError("Invalid public point"));
    }
    if(!even_y)
    {
        BN_sub(d.get(), n, d.get());
    }
    Bytes p_bytes = bnToBytes(px.get());
    Bytes d_bytes = bnToBytes(d.get());

    Bytes t = taggedHash("BIP0340/aux", aux_bytes);
    for(size_t i = 0; i < 32; i++)
    {
        t[i] ^= d_bytes[i];
    }
    Bytes rand = taggedHash("BIP0340/nonce", concat({&t, &p_bytes, &*msg}));
    BNPtr k = bnFromBytes(rand.data(), rand.size());
    BN_nnmod(k.get(), k.get(), n, ctx.get());
    if(BN_is_zero(k.get()))
    {
        return std::unexpected(internalError("Nonce is zero"));
    }

    PointPtr r_pt(EC_POINT_new(group));
    EC_POINT_mul(group, r_pt.get(), k.get(), nullptr, nullptr, ctx.get());
    BNPtr rx(BN_new());
    if(!pointCoordinates(r_pt.get(), rx.get(), even_y, ctx.get()))
    {
        return std::unexpected(internalError("Invalid nonce point"));
    }
    if(!even_y)
    {
        BN_sub(k.get(), n, k.get());
    }
    Bytes r_bytes = bnToBytes(rx.get());

    Bytes e_hash =
        taggedHash("BIP0340/challenge", concat({&r_bytes, &p_bytes, &*msg}));
    BNPtr e = bnFromBytes(e_hash.data(), e_hash.size());
    BN_nnmod(e.get(), e.get(), n, ctx.get());

    BNPtr s(BN_new());
    BN_mod_mul(s.get(), e.get(), d.get(), n, ctx.get());
    BN_mod_add(s.get(), s.get(), k.get(), n, ctx.get());

    Bytes sig = r_bytes;
    Bytes s_bytes = bnToBytes(s.get());
    sig.insert(sig.end(), s_bytes.begin(), s_bytes.end());
    return hexEncode(sig);
}

bool verify(std::string_view pubkey_hex, std::string_view msg_hex,
            std::string_view sig_hex)
{
    if(!curve().group)
    {
        return false;
    }
    auto pk = hexDecode(pubkey_hex);
    auto msg = hexDecode(msg_hex);
    auto sig = hexDecode(sig_hex);
    if(!pk || !msg || !sig || pk->size() != 32 || msg->size() != 32 ||
       sig->size() != 64)
    {
        return false;
    }

    const EC_GROUP* group = curve().group.get();
    const BIGNUM* n = curve().n.get();
    BNCtxPtr ctx(BN_CTX_new());

    PointPtr p_pt = liftX(*pk, ctx.get());
    if(!p_pt)
    {
        return false;
    }
    Bytes r_bytes(sig->begin(), sig->begin() + 32);
    BNPtr r = bnFromBytes(r_bytes.data(), 32);
    BNPtr s = bnFromBytes(sig->data() + 32, 32);
    if(BN_cmp(r.get(), curve().p.get()) >= 0 || BN_cmp(s.get(), n) >= 0)
    {
        return false;
    }

    Bytes e_hash =
        taggedHash("BIP0340/challenge", concat({&r_bytes, &*pk, &*msg}));
    BNPtr e = bnFromBytes(e_hash.data(), e_hash.size());
    BN_nnmod(e.get(), e.get(), n, ctx.get());
    BNPtr neg_e(BN_new());
    BN_mod_sub(neg_e.get(), n, e.get(), n, ctx.get());

    // R = s*G - e*P
    PointPtr r_pt(EC_POINT_new(group));
    if(EC_POINT_mul(group, r_pt.get(), s.get(), p_pt.get(), neg_e.get(),
                    ctx.get()) != 1 ||
       EC_POINT_is_at_infinity(group, r_pt.get()))
    {
        return false;
    }
    BNPtr rx(BN_new());
    bool even_y = false;
    if(!pointCoordinates(r_pt.get(), rx.get(), even_y, ctx.get()))
    {
        return false;
    }
    return even_y && BN_cmp(rx.get(), r.get()) == 0;
}

E<std::string> secretFromSeed(const std::vector<unsigned char>& seed)
{
    if(!curve().group)
    {
        return std::unexpected(internalError("secp256k1 is not available"));
    }
    BNCtxPtr ctx(BN_CTX_new());
    BNPtr d = bnFromBytes(seed.data(), seed.size());
    BN_nnmod(d.get(), d.get(), curve().n.get(), ctx.get());
    if(BN_is_zero(d.get()))
    {
        return std::unexpected(invalidInput("Seed reduces to zero"));
    }
    return hexEncode(bnToBytes(d.get()));
}

E<std::string> generateSecret()
{
    Bytes seed(32);
    if(RAND_bytes(seed.data(), 32) != 1)
    {
        return std::unexpected(internalError("RAND_bytes failed"));
    }
    return secretFromSeed(seed);
}

} // namespace schnorr
