#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devchain/embedding/descriptor.hpp"
#include "devchain/embedding/model_http.hpp"
#include "devchain/embedding/model_local.hpp"

#include <cmath>

void register_embedding_model_tests(std::vector<devchain::tests::TestCase> &tests) {
  using devchain::tests::require;
  namespace emb = devchain::embedding;
  namespace common = devchain::common;
  namespace t = devchain::testing;

  tests.push_back({"local_model_outputs_unit_vectors", [] {
                     emb::LocalHashModel model(64);
                     auto vectors = model.encode({"motion sensor that detects motion in kitchen area",
                                                  "x", "light device that controls lighting"},
                                                 2);
                     require(vectors.ok(), vectors.error());
                     require(vectors.value().size() == 3, "one vector per text");
                     for (const auto &vector : vectors.value()) {
                       require(vector.size() == 64, "dimension");
                       require(emb::is_unit(vector), "unit norm");
                     }
                     require(model.is_loaded(), "encode loads the model");
                   }});

  tests.push_back({"local_model_is_deterministic_and_versioned", [] {
                     emb::LocalHashModel first(128);
                     emb::LocalHashModel second(128);
                     auto a = first.encode_one("door sensor that detects door in hall area");
                     auto b = second.encode_one("door sensor that detects door in hall area");
                     require(a.ok() && b.ok(), "encode ok");
                     require(a.value() == b.value(), "same text, same vector");
                     require(first.version() == "local-hash-v1-128", first.version());
                     require(emb::LocalHashModel(64).version() != first.version(),
                             "dimension is part of the version");
                   }});

  tests.push_back({"local_model_related_texts_score_higher", [] {
                     emb::LocalHashModel model(384);
                     const auto kitchen_light =
                         model.encode_one("light device that controls lighting in kitchen area");
                     const auto kitchen_lamp =
                         model.encode_one("light device that controls lighting in kitchen area with brightness");
                     const auto garage_lock =
                         model.encode_one("garage door sensor that detects garage door");
                     require(kitchen_light.ok() && kitchen_lamp.ok() && garage_lock.ok(), "ok");
                     require(emb::dot(kitchen_light.value(), kitchen_lamp.value()) >
                                 emb::dot(kitchen_light.value(), garage_lock.value()),
                             "overlap should raise similarity");
                   }});

  tests.push_back({"local_model_rejects_featureless_text", [] {
                     emb::LocalHashModel model(32);
                     auto vector = model.encode_one("   ");
                     require(!vector.ok(), "blank text has no features");
                     require(vector.code() == common::ErrorCode::ModelUnavailable,
                             "ModelUnavailable expected");
                   }});

  tests.push_back({"local_model_embeds_degraded_descriptor", [] {
                     const emb::DescriptorBuilder builder;
                     emb::LocalHashModel model(64);
                     const auto text = builder.build(t::make_device("switch.bare", "switch"));
                     auto vector = model.encode_one(text);
                     require(vector.ok(), vector.error());
                     require(emb::is_unit(vector.value()), "valid embedding");
                   }});

  tests.push_back({"http_model_batches_and_renormalises", [] {
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->on("GET", "http://embed:1/health", t::json_response(R"({"ok":true})"));
                     http->on("POST", "http://embed:1/embeddings",
                              t::json_response(R"({"embeddings":[[3,4],[0,2]]})"));
                     http->on("POST", "http://embed:1/embeddings",
                              t::json_response(R"({"embeddings":[[1,0]]})"));

                     devchain::config::EmbeddingConfig config;
                     config.provider = "http";
                     config.base_url = "http://embed:1";
                     config.dimensions = 2;
                     emb::HttpEmbeddingModel model(config, http);
                     auto vectors = model.encode({"a", "b", "c"}, 2);
                     require(vectors.ok(), vectors.error());
                     require(vectors.value().size() == 3, "three vectors");
                     require(std::abs(vectors.value()[0][0] - 0.6F) < 1e-5F, "renormalised");
                     require(http->requests.size() == 3, "health + two batches");
                     require(http->requests[1].body == R"({"texts":["a","b"],"normalize":true})",
                             http->requests[1].body);
                     require(model.version() == config.model, "version is model name");
                   }});

  tests.push_back({"http_model_failures_are_model_unavailable", [] {
                     devchain::config::EmbeddingConfig config;
                     config.base_url = "http://embed:1";
                     config.dimensions = 2;

                     auto down = std::make_shared<t::FakeHttpClient>();
                     emb::HttpEmbeddingModel offline(config, down);
                     auto status = offline.load();
                     require(!status.ok(), "health failure");
                     require(status.code() == common::ErrorCode::ModelUnavailable, "code");

                     auto wrong = std::make_shared<t::FakeHttpClient>();
                     wrong->on("GET", "http://embed:1/health", t::json_response("{}"));
                     wrong->on("POST", "http://embed:1/embeddings",
                               t::json_response(R"({"embeddings":[[1,0,0]]})"));
                     emb::HttpEmbeddingModel bad_dims(config, wrong);
                     auto vectors = bad_dims.encode({"a"}, 8);
                     require(!vectors.ok(), "wrong dimension rejected");
                     require(vectors.code() == common::ErrorCode::ModelUnavailable, "code");

                     auto zeros = std::make_shared<t::FakeHttpClient>();
                     zeros->on("GET", "http://embed:1/health", t::json_response("{}"));
                     zeros->on("POST", "http://embed:1/embeddings",
                               t::json_response(R"({"embeddings":[[0,0],[1,1]]})"));
                     emb::HttpEmbeddingModel zero_model(config, zeros);
                     require(!zero_model.encode({"a", "b"}, 8).ok(), "zero vector rejected");

                     auto short_reply = std::make_shared<t::FakeHttpClient>();
                     short_reply->on("GET", "http://embed:1/health", t::json_response("{}"));
                     short_reply->on("POST", "http://embed:1/embeddings",
                                     t::json_response(R"({"embeddings":[[1,1]]})"));
                     emb::HttpEmbeddingModel short_model(config, short_reply);
                     require(!short_model.encode({"a", "b"}, 8).ok(), "count mismatch rejected");
                   }});

  tests.push_back({"embedding_model_factory_selects_provider", [] {
                     devchain::config::EmbeddingConfig config;
                     config.dimensions = 16;
                     auto local = emb::create_embedding_model(config);
                     require(local.ok() && local.value()->name() == "local", "local provider");
                     require(local.value()->dimensions() == 16, "dimensions passed through");
                     config.provider = "http";
                     auto http = emb::create_embedding_model(config,
                                                             std::make_shared<t::FakeHttpClient>());
                     require(http.ok() && http.value()->name() == "http", "http provider");
                     config.provider = "onnx";
                     require(!emb::create_embedding_model(config).ok(), "unknown provider");
                   }});
}
