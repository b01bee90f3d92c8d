/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

//  Self-signed certificate for localhost and 127.0.0.1, PEM encoded.
struct test_identity_t
{
    std::string cert;
    std::string key;
};

static test_identity_t server_identity;
static test_identity_t other_identity;

static std::string bio_contents (BIO *bio_)
{
    char *data = NULL;
    const long size = BIO_get_mem_data (bio_, &data);
    TEST_ASSERT_TRUE (size > 0);
    return std::string (data, static_cast<size_t> (size));
}

static void add_extension (X509 *cert_, int nid_, const char *value_)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb (&ctx);
    X509V3_set_ctx (&ctx, cert_, cert_, NULL, NULL, 0);
    X509_EXTENSION *ext =
      X509V3_EXT_conf_nid (NULL, &ctx, nid_, const_cast<char *> (value_));
    TEST_ASSERT_NOT_NULL (ext);
    TEST_ASSERT_EQUAL_INT (1, X509_add_ext (cert_, ext, -1));
    X509_EXTENSION_free (ext);
}

static test_identity_t make_identity (const char *common_name_)
{
    EVP_PKEY_CTX *kctx = EVP_PKEY_CTX_new_id (EVP_PKEY_RSA, NULL);
    TEST_ASSERT_NOT_NULL (kctx);
    TEST_ASSERT_EQUAL_INT (1, EVP_PKEY_keygen_init (kctx));
    TEST_ASSERT_TRUE (EVP_PKEY_CTX_set_rsa_keygen_bits (kctx, 2048) > 0);
    EVP_PKEY *key = NULL;
    TEST_ASSERT_EQUAL_INT (1, EVP_PKEY_keygen (kctx, &key));
    EVP_PKEY_CTX_free (kctx);

    X509 *cert = X509_new ();
    TEST_ASSERT_NOT_NULL (cert);
    X509_set_version (cert, 2);
    ASN1_INTEGER_set (X509_get_serialNumber (cert), 1);
    X509_gmtime_adj (X509_getm_notBefore (cert), -3600);
    X509_gmtime_adj (X509_getm_notAfter (cert), 86400);
    X509_set_pubkey (cert, key);

    X509_NAME *name = X509_get_subject_name (cert);
    X509_NAME_add_entry_by_txt (
      name, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char *> (common_name_), -1, -1, 0);
    X509_set_issuer_name (cert, name);

    add_extension (cert, NID_basic_constraints, "critical,CA:TRUE");
    add_extension (cert, NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1");
    TEST_ASSERT_TRUE (X509_sign (cert, key, EVP_sha256 ()) > 0);

    test_identity_t identity;
    BIO *bio = BIO_new (BIO_s_mem ());
    TEST_ASSERT_EQUAL_INT (1, PEM_write_bio_X509 (bio, cert));
    identity.cert = bio_contents (bio);
    BIO_free (bio);

    bio = BIO_new (BIO_s_mem ());
    TEST_ASSERT_EQUAL_INT (
      1, PEM_write_bio_PrivateKey (bio, key, NULL, NULL, 0, NULL, NULL));
    identity.key = bio_contents (bio);
    BIO_free (bio);

    X509_free (cert);
    EVP_PKEY_free (key);
    return identity;
}

void setUp ()
{
}

void tearDown ()
{
}

static void bind_tls (qlink::server_t &server_)
{
    TEST_ASSERT_SUCCESS_ERRNO (
      server_.set (QLINK_TLS_CERT, server_identity.cert));
    TEST_ASSERT_SUCCESS_ERRNO (server_.set (QLINK_TLS_KEY, server_identity.key));
    TEST_ASSERT_SUCCESS_ERRNO (server_.bind ("tls://127.0.0.1:0"));
}

void test_tls_send_recv ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    bind_tls (server);

    const std::string endpoint = server.last_endpoint ();
    TEST_ASSERT_EQUAL_INT (0, endpoint.compare (0, 16, "tls://127.0.0.1:"));

    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, server_identity.cert));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_HOSTNAME, "localhost"));

    qlink::connection_id_t client_side, server_side;
    TEST_ASSERT_SUCCESS_ERRNO (client.connect (endpoint, &client_side));
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&server_side, EVENT_TIMEOUT));

    qlink::event_t event;
    expect_event (server, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_INT (0, event.address.compare (0, 6, "tls://"));

    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "HELLOWORLD", 10));
    TEST_ASSERT_EQUAL_STRING ("HELLOWORLD", recv_message (server).c_str ());

    std::string large (200000, 0);
    for (size_t i = 0; i < large.size (); i++)
        large[i] = static_cast<char> (i % 253);
    TEST_ASSERT_SUCCESS_ERRNO (
      server.send (server_side, large.data (), large.size ()));
    TEST_ASSERT_TRUE (recv_message (client) == large);
}

void test_tls_pubsub ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    bind_tls (server);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, server_identity.cert));

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side;
    TEST_ASSERT_SUCCESS_ERRNO (
      client.connect (server.last_endpoint (), &client_side));
    msleep (SETTLE_TIME);

    TEST_ASSERT_EQUAL_INT (1, server.publish ("ticks", "1.0841", 6));
    TEST_ASSERT_EQUAL_STRING ("1.0841", recv_message (client).c_str ());
}

void test_tls_untrusted_server ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    bind_tls (server);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, other_identity.cert));

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ECONNECTION,
                               client.connect (server.last_endpoint (), &id));
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.accept (&id, SETTLE_TIME));
}

void test_tls_hostname_mismatch ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    bind_tls (server);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, server_identity.cert));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_HOSTNAME, "example.org"));

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ECONNECTION,
                               client.connect (server.last_endpoint (), &id));
}

void test_tls_silent_client_is_dropped ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_HANDSHAKE_IVL, 200));
    bind_tls (server);

    //  Connects but never sends a ClientHello.
    const int64_t started = now_ms ();
    const int fd = connect_raw (server.last_endpoint ());
    TEST_ASSERT_TRUE (wait_for_eof (fd));
    TEST_ASSERT_TRUE (now_ms () - started >= 150);
    close (fd);

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.accept (&id, 0));
}

void test_tls_bind_without_certificate ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, server.bind ("tls://127.0.0.1:0"));

    TEST_ASSERT_SUCCESS_ERRNO (
      server.set (QLINK_TLS_CERT, "-----BEGIN CERTIFICATE-----\ngarbage\n"));
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_TLS_KEY, server_identity.key));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, server.bind ("tls://127.0.0.1:0"));

    TEST_ASSERT_SUCCESS_ERRNO (
      server.set (QLINK_TLS_CERT, "/nonexistent/server.pem"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, server.bind ("tls://127.0.0.1:0"));
}

void test_tls_options ()
{
    qlink::context_t context;
    qlink::client_t client (context);

    std::string value;
    TEST_ASSERT_SUCCESS_ERRNO (client.get (QLINK_TLS_HOSTNAME, &value));
    TEST_ASSERT_TRUE (value.empty ());

    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_HOSTNAME, "localhost"));
    TEST_ASSERT_SUCCESS_ERRNO (client.get (QLINK_TLS_HOSTNAME, &value));
    TEST_ASSERT_EQUAL_STRING ("localhost", value.c_str ());

    //  Larger than the first read buffer.
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, server_identity.cert));
    TEST_ASSERT_SUCCESS_ERRNO (client.get (QLINK_TLS_CA, &value));
    TEST_ASSERT_TRUE (value == server_identity.cert);

    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_TLS_CA, std::string ()));
    TEST_ASSERT_SUCCESS_ERRNO (client.get (QLINK_TLS_CA, &value));
    TEST_ASSERT_TRUE (value.empty ());

    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               client.get (QLINK_MAX_STREAMS, &value));
}

int main ()
{
    setup_test_environment ();

    server_identity = make_identity ("qlink test server");
    other_identity = make_identity ("qlink other server");

    UNITY_BEGIN ();
    RUN_TEST (test_tls_send_recv);
    RUN_TEST (test_tls_pubsub);
    RUN_TEST (test_tls_untrusted_server);
    RUN_TEST (test_tls_hostname_mismatch);
    RUN_TEST (test_tls_silent_client_is_dropped);
    RUN_TEST (test_tls_bind_without_certificate);
    RUN_TEST (test_tls_options);
    return UNITY_END ();
}
