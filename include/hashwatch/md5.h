#ifndef HASHWATCH_MD5_H
#define HASHWATCH_MD5_H

#include <string>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace hashwatch::crypto {

    /**
     * @brief Incremental MD5 over OpenSSL's EVP interface.
     * Used for change detection only, never for anything security sensitive.
     */
    class MD5 {
    public:
        MD5() : m_ctx(EVP_MD_CTX_new()) {
            if (!m_ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
            reset();
        }

        void update(const void* data, size_t len) {
            if (EVP_DigestUpdate(m_ctx.get(), data, len) != 1) {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
        }

        /**
         * @brief Finishes the digest and returns it as lower-case hex.
         * The object is reset and can be reused afterwards.
         */
        std::string final() {
            unsigned char out[EVP_MAX_MD_SIZE];
            unsigned int out_len = 0;
            if (EVP_DigestFinal_ex(m_ctx.get(), out, &out_len) != 1) {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }

            static const char digits[] = "0123456789abcdef";
            std::string hex;
            hex.reserve(out_len * 2);
            for (unsigned int i = 0; i < out_len; ++i) {
                hex += digits[out[i] >> 4];
                hex += digits[out[i] & 0x0F];
            }
            reset();
            return hex;
        }

        static std::string hash(const std::string& data) {
            MD5 md5;
            md5.update(data.data(), data.size());
            return md5.final();
        }

    private:
        struct CtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        std::unique_ptr<EVP_MD_CTX, CtxDeleter> m_ctx;

        void reset() {
            if (EVP_DigestInit_ex(m_ctx.get(), EVP_md5(), nullptr) != 1) {
                throw std::runtime_error("EVP_DigestInit_ex failed");
            }
        }
    };
}
#endif
