// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>


using namespace fse;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL without thread support: control channel keep-alive runs on a worker thread!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, "Error code " + numberTo<std::string>(ec), errorBuf);
}


std::string formatSslErrorCode(int ec)
{
    switch (ec)
    {
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_NONE);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_SSL);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_READ);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_WRITE);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_X509_LOOKUP);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_SYSCALL);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_ZERO_RETURN);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_CONNECT);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ACCEPT);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ASYNC);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ASYNC_JOB);
            FSE_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_CLIENT_HELLO_CB);
        default:
            return "SSL error " + numberTo<std::string>(ec);
    }
}


//call right after the failed SSL_* function: SSL_get_error() inspects the thread's error queue
[[noreturn]] void throwSslIoError(const char* functionName, ssl_st* ssl, int rv)
{
    const ErrorCode lastError = getLastError(); //read before any other call!
    const int sslError = ::SSL_get_error(ssl, rv);

    switch (sslError)
    {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE: //blocking socket: SO_RCVTIMEO/SO_SNDTIMEO expired
            ::ERR_clear_error();
            throw SysError(formatSystemError(functionName, ETIMEDOUT));

        case SSL_ERROR_SYSCALL:
            if (::ERR_peek_last_error() != 0)
                throw SysError(formatLastOpenSSLError(functionName));
            if (lastError != 0)
                throw SysError(formatSystemError(functionName, lastError));
            throw SysError(formatSystemError(functionName, formatSslErrorCode(sslError), "Unexpected end of file."));

        case SSL_ERROR_SSL:
        {
            std::string msg = formatLastOpenSSLError(functionName);

            const long verifyResult = ::SSL_get_verify_result(ssl);
            if (verifyResult != X509_V_OK)
                msg += '\n' + std::string(::X509_verify_cert_error_string(verifyResult));
            throw SysError(msg);
        }
    }
    ::ERR_clear_error();
    throw SysError(formatSystemError(functionName, formatSslErrorCode(sslError), ""));
}


bool isIpAddressLiteral(const std::string& host)
{
    unsigned char buf[sizeof(in6_addr)] = {};
    return ::inet_pton(AF_INET,  host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}
}


std::string fse::formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


void fse::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    //explicitly init OpenSSL on main thread: seems to initialize atomically! But it still might help to avoid issues:
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError("Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


namespace
{
//OpenSSL 1.1.0+ deprecates all clean up functions, but thread-local data is still leaked without:
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}

//================================================================================

class fse::TlsSession
{
public:
    explicit TlsSession(SSL_SESSION* session) : session_(session) {} //take ownership
    ~TlsSession() { ::SSL_SESSION_free(session_); }

    SSL_SESSION* get() const { return session_; }

private:
    TlsSession           (const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    SSL_SESSION* const session_;
};

//================================================================================

TlsContext::TlsContext(TlsRole role) : role_(role)
{
    ctx_ = ::SSL_CTX_new(role == TlsRole::client ? ::TLS_client_method() : ::TLS_server_method());
    if (!ctx_)
        throw SysError(formatLastOpenSSLError("SSL_CTX_new"));
    FSE_ON_SCOPE_FAIL(::SSL_CTX_free(ctx_));

    if (::SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_set_min_proto_version"));

    //FTPS data connections are closed by the server without close_notify more often than not
    //=> transfer completeness is confirmed by the control channel reply instead
    ::SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);

    if (role == TlsRole::client)
    {
        ::SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        //sessions are handed over explicitly (TlsStream::getSession()): the internal cache would invalidate
        //a TLS 1.3 session after its first resumption
        ::SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_OFF);
    }
    else
    {
        const unsigned char sessionIdContext[] = "fse-tls";
        if (::SSL_CTX_set_session_id_context(ctx_, sessionIdContext, sizeof(sessionIdContext) - 1) != 1)
            throw SysError(formatLastOpenSSLError("SSL_CTX_set_session_id_context"));
        ::SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_SERVER);
    }
}


TlsContext::~TlsContext()
{
    ::SSL_CTX_free(ctx_);
}


void TlsContext::setTrustedCaFile(const std::string& caFilePath) //throw SysError
{
    if (::SSL_CTX_load_verify_locations(ctx_, caFilePath.c_str(), nullptr) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_load_verify_locations") + "\n" + caFilePath);

    ::SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
}


void TlsContext::setCertificate(const std::string& certPem, const std::string& privateKeyPem) //throw SysError
{
    auto readPem = [](const std::string& pem, auto readFun, const char* functionName)
    {
        BIO* bio = ::BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
        if (!bio)
            throw SysError(formatLastOpenSSLError("BIO_new_mem_buf"));
        FSE_ON_SCOPE_EXIT(::BIO_free_all(bio));

        if (auto obj = readFun(bio, nullptr, nullptr, nullptr))
            return obj;
        throw SysError(formatLastOpenSSLError(functionName));
    };

    X509* cert = readPem(certPem, ::PEM_read_bio_X509, "PEM_read_bio_X509");
    FSE_ON_SCOPE_EXIT(::X509_free(cert));

    EVP_PKEY* privateKey = readPem(privateKeyPem, ::PEM_read_bio_PrivateKey, "PEM_read_bio_PrivateKey");
    FSE_ON_SCOPE_EXIT(::EVP_PKEY_free(privateKey));

    if (::SSL_CTX_use_certificate(ctx_, cert) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_use_certificate"));

    if (::SSL_CTX_use_PrivateKey(ctx_, privateKey) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_use_PrivateKey"));

    if (::SSL_CTX_check_private_key(ctx_) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_check_private_key"));
}


void TlsContext::setMaxProtocolVersion(TlsVersion version) //throw SysError
{
    if (::SSL_CTX_set_max_proto_version(ctx_, version == TlsVersion::tls12 ? TLS1_2_VERSION : TLS1_3_VERSION) != 1)
        throw SysError(formatLastOpenSSLError("SSL_CTX_set_max_proto_version"));
}

//================================================================================

TlsStream::TlsStream(TlsContext& ctx, SocketType socket,
                     const std::string& serverName,
                     const std::shared_ptr<TlsSession>& resumeSession) //throw SysError
{
    ssl_ = ::SSL_new(ctx.get());
    if (!ssl_)
        throw SysError(formatLastOpenSSLError("SSL_new"));
    FSE_ON_SCOPE_FAIL(::SSL_free(ssl_));

    if (::SSL_set_fd(ssl_, socket) != 1)
        throw SysError(formatLastOpenSSLError("SSL_set_fd"));

    if (ctx.getRole() == TlsRole::client)
    {
        //SNI: "Literal IPv4 and IPv6 addresses are not permitted in HostName" (RFC 6066)
        if (!serverName.empty() && !isIpAddressLiteral(serverName))
            if (::SSL_set_tlsext_host_name(ssl_, serverName.c_str()) != 1)
                throw SysError(formatLastOpenSSLError("SSL_set_tlsext_host_name"));

        if (resumeSession)
        {
            //resume from a private copy: OpenSSL marks the session of a connection as non-resumable
            //after a TLS 1.3 resumption or when the connection fails => don't spoil the caller's session
            SSL_SESSION* sessionCopy = ::SSL_SESSION_dup(resumeSession->get());
            if (!sessionCopy)
                throw SysError(formatLastOpenSSLError("SSL_SESSION_dup"));
            FSE_ON_SCOPE_EXIT(::SSL_SESSION_free(sessionCopy)); //SSL_set_session() holds its own reference

            if (::SSL_set_session(ssl_, sessionCopy) != 1)
                throw SysError(formatLastOpenSSLError("SSL_set_session"));
        }

        errno = 0;
        const int rv = ::SSL_connect(ssl_);
        if (rv != 1)
            throwSslIoError("SSL_connect", ssl_, rv);
    }
    else
    {
        errno = 0;
        const int rv = ::SSL_accept(ssl_);
        if (rv != 1)
            throwSslIoError("SSL_accept", ssl_, rv);
    }
}


TlsStream::~TlsStream()
{
    //without close_notify SSL_free() discards the session as "bad": a dropped connection (e.g. the
    //server closed the data connection first) is not a reason to give up session resumption
    if (!shutdownSent_)
        ::SSL_set_shutdown(ssl_, SSL_SENT_SHUTDOWN);

    ::SSL_free(ssl_);
}


size_t TlsStream::tryRead(void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    for (;;)
    {
        size_t bytesReceived = 0;
        errno = 0;
        const int rv = ::SSL_read_ex(ssl_, buffer, bytesToRead, &bytesReceived);
        if (rv == 1)
        {
            ASSERT_SYSERROR(bytesReceived <= bytesToRead); //better safe than sorry
            return bytesReceived;
        }

        const int sslError = ::SSL_get_error(ssl_, rv);
        if (sslError == SSL_ERROR_ZERO_RETURN) //close_notify (or TCP EOF: SSL_OP_IGNORE_UNEXPECTED_EOF)
            return 0;
        if (sslError == SSL_ERROR_WANT_READ && errno == EINTR)
            continue;

        throwSslIoError("SSL_read_ex", ssl_, rv);
    }
}


size_t TlsStream::tryWrite(const void* buffer, size_t bytesToWrite) //throw SysError; may return short!
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    for (;;)
    {
        size_t bytesWritten = 0;
        errno = 0;
        const int rv = ::SSL_write_ex(ssl_, buffer, bytesToWrite, &bytesWritten);
        if (rv == 1)
        {
            ASSERT_SYSERROR(0 < bytesWritten && bytesWritten <= bytesToWrite); //better safe than sorry
            return bytesWritten;
        }

        if (::SSL_get_error(ssl_, rv) == SSL_ERROR_WANT_WRITE && errno == EINTR)
            continue;

        throwSslIoError("SSL_write_ex", ssl_, rv);
    }
}


bool TlsStream::hasPendingData() const
{
    return ::SSL_pending(ssl_) > 0;
}


void TlsStream::shutdown() //throw SysError
{
    if (shutdownSent_)
        return;
    shutdownSent_ = true;

    errno = 0;
    const int rv = ::SSL_shutdown(ssl_); //0: close_notify sent, peer's not yet received => good enough
    if (rv < 0)
        throwSslIoError("SSL_shutdown", ssl_, rv);
}


std::shared_ptr<TlsSession> TlsStream::getSession() const
{
    SSL_SESSION* session = ::SSL_get1_session(ssl_);
    if (!session)
        return nullptr;

    auto output = std::make_shared<TlsSession>(session); //pass ownership

    //TLS 1.3: tickets arrive after the handshake, i.e. with the first application data read
    if (::SSL_SESSION_is_resumable(session) != 1)
        return nullptr;

    return output;
}


bool TlsStream::isSessionReused() const
{
    return ::SSL_session_reused(ssl_) == 1;
}


bool TlsStream::peerMatchesHost(const std::string& host) const //throw SysError
{
    X509* cert = ::SSL_get1_peer_certificate(ssl_);
    if (!cert)
        throw SysError(formatSystemError("SSL_get1_peer_certificate", "", "Peer did not present a certificate."));
    FSE_ON_SCOPE_EXIT(::X509_free(cert));

    if (isIpAddressLiteral(host))
        return ::X509_check_ip_asc(cert, host.c_str(), 0) == 1;

    return ::X509_check_host(cert, host.c_str(), host.size(), 0 /*flags*/, nullptr /*peername*/) == 1;
}


std::string TlsStream::getProtocolVersion() const
{
    return ::SSL_get_version(ssl_);
}


std::string TlsStream::getCipherName() const
{
    if (const char* name = ::SSL_get_cipher_name(ssl_))
        return name;
    return std::string();
}
