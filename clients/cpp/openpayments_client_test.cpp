#include "openpayments_client.hpp"
#include "openpayments_errors.hpp"
#include "openpayments_test_support.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <stdexcept>
#include <string>

using namespace openpayments;
using openpayments_test::StubTransport;
using openpayments_test::throws;

namespace {
const std::string kWallet = "https://ilp.example.com/alice";

OpenPaymentsClient make_client(StubTransport*& stub) {
  return OpenPaymentsClient(kWallet, openpayments_test::test_signer("key-1"), std::nullopt,
                            openpayments_test::make_stub(stub));
}

void test_wallet_lookup() {
  StubTransport* stub = nullptr;
  OpenPaymentsClient client = make_client(stub);
  assert(client.base_url() == "https://ilp.example.com");

  stub->enqueue(200, R"({"id":"https://ilp.example.com/alice","publicName":"Alice","assetCode":"USD",
      "assetScale":2,"authServer":"https://auth.ilp.example.com","resourceServer":"https://ilp.example.com"})");
  WalletAddress own = client.get_wallet_info();
  assert(own.id == kWallet);
  assert(*own.public_name == "Alice");
  assert(own.asset_code == "USD");
  assert(own.asset_scale == 2);
  assert(own.auth_server == "https://auth.ilp.example.com");
  assert(own.resource_server == "https://ilp.example.com");

  const HttpRequest& get = stub->requests[0];
  assert(get.method == "GET");
  assert(get.url == kWallet);
  assert(get.header("Accept") == "application/json");
  assert(get.header("Signature").empty());
  assert(get.header("Authorization").empty());

  stub->enqueue(200, R"({"id":"https://other.example/bob"})");
  WalletAddress other = client.get_wallet_info(std::string("https://other.example/bob"));
  assert(other.id == "https://other.example/bob");
  assert(!other.public_name);
  assert(stub->requests[1].url == "https://other.example/bob");

  stub->enqueue(404, "not found");
  assert(throws<HttpError>([&] { client.get_wallet_info(std::string("https://other.example/nobody")); }));
  stub->enqueue(200, R"({"publicName":"no id"})");
  assert(throws<ProtocolError>([&] { client.get_wallet_info(); }));
}

void test_create_quote_signed() {
  StubTransport* stub = nullptr;
  OpenPaymentsClient client = make_client(stub);
  stub->enqueue(201, R"({"id":"https://ilp.example.com/quotes/q1","walletAddress":"https://ilp.example.com/alice",
      "receiver":"https://other.example/incoming-payments/1","method":"ilp","expiresAt":"2030-01-01T00:00:00Z",
      "sendAmount":{"value":"100","assetCode":"USD","assetScale":2},
      "receiveAmount":{"value":"92","assetCode":"EUR","assetScale":2}})");

  Amount send;
  send.value = "100";
  send.asset_code = "USD";
  send.asset_scale = 2;
  Quote quote = client.create_quote("https://other.example/bob", send);
  assert(quote.id == "https://ilp.example.com/quotes/q1");
  assert(quote.send_amount->value == "100");
  assert(quote.receive_amount->asset_code == "EUR");
  assert(*quote.expires_at == "2030-01-01T00:00:00Z");

  const HttpRequest& post = stub->requests[0];
  assert(post.method == "POST");
  assert(post.url == "https://ilp.example.com/quotes");
  assert(post.header("Authorization").empty());
  const nlohmann::json body = nlohmann::json::parse(post.body);
  assert(body["walletAddress"] == "https://other.example/bob");
  assert(body["method"] == "ilp");
  assert(body["sendAmount"]["value"] == "100");
  assert(!body.contains("receiveAmount"));

  SignedHeaders headers;
  headers.signature = post.header("Signature");
  headers.signature_input = post.header("Signature-Input");
  verify_signed_request(openpayments_test::rfc8032_public_key(), "POST", post.url, post.body, headers);
}

void test_create_quote_with_receive_amount_and_token() {
  StubTransport* stub = nullptr;
  OpenPaymentsClient client(kWallet, openpayments_test::test_signer(), std::string("https://rs.example/"),
                            openpayments_test::make_stub(stub));
  stub->enqueue(201, R"({"id":"https://rs.example/quotes/q2"})");

  Amount receive;
  receive.value = "5000";
  receive.asset_code = "MXN";
  receive.asset_scale = 2;
  Quote quote = client.create_quote("https://other.example/bob", std::nullopt, receive, std::string("quote-token"));
  assert(quote.wallet_address == "https://other.example/bob");
  assert(quote.method == "ilp");

  const HttpRequest& post = stub->requests[0];
  assert(post.url == "https://rs.example/quotes");
  assert(post.header("Authorization") == "GNAP quote-token");
  assert(!post.header("Signature").empty());
  const nlohmann::json body = nlohmann::json::parse(post.body);
  assert(body["receiveAmount"]["value"] == "5000");
  assert(!body.contains("sendAmount"));
}

void test_quote_amount_rules() {
  StubTransport* stub = nullptr;
  OpenPaymentsClient client = make_client(stub);
  Amount a;
  a.value = "1";
  a.asset_code = "USD";
  a.asset_scale = 2;
  assert(throws<std::invalid_argument>([&] { client.create_quote("https://other.example/bob", std::nullopt); }));
  assert(throws<std::invalid_argument>([&] { client.create_quote("https://other.example/bob", a, a); }));
  assert(stub->requests.empty());

  stub->enqueue(500, "boom");
  assert(throws<HttpError>([&] { client.create_quote("https://other.example/bob", a); }));
}
} // namespace

int main() {
  test_wallet_lookup();
  test_create_quote_signed();
  test_create_quote_with_receive_amount_and_token();
  test_quote_amount_rules();
  return 0;
}
