#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>

#include "hoard/core/platform_utils.hpp"
#include "hoard/library/image_library.hpp"
#include "hoard/retrieval/pipeline.hpp"

using hoard::core::safe_getenv;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "HOARD_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "HOARD_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

TEST_CASE("env_u32 keeps the fallback and rejects malformed values", "[platform][env]") {
    const char* key = "HOARD_TEST_ENV_U32";
    unset_env_var(key);
    REQUIRE(hoard::core::env_u32(key, 7).value() == 7u);

    set_env_var(key, "128");
    REQUIRE(hoard::core::env_u32(key, 7).value() == 128u);

    set_env_var(key, "12abc");
    auto bad = hoard::core::env_u32(key, 7);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == hoard::core::error_code::config_invalid);

    set_env_var(key, "0");
    REQUIRE_FALSE(hoard::core::env_u32(key, 7).has_value());
    unset_env_var(key);
}

TEST_CASE("vector backend selection from the environment", "[platform][env][config]") {
    set_env_var("HOARD_VECTOR_BACKEND", "redis");
    set_env_var("HOARD_REDIS_HOST", "10.0.0.5");
    set_env_var("HOARD_REDIS_PORT", "6380");
    auto cfg = hoard::vector::VectorStoreConfig::from_env({});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->backend == hoard::vector::VectorStoreConfig::Backend::redis);
    REQUIRE(cfg->redis_host == "10.0.0.5");
    REQUIRE(cfg->redis_port == 6380);

    set_env_var("HOARD_VECTOR_BACKEND", "milvus");
    auto bad = hoard::library::LibraryOptions::from_env();
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == hoard::core::error_code::config_invalid);

    set_env_var("HOARD_VECTOR_BACKEND", "local");
    set_env_var("HOARD_REDIS_PORT", "70000");
    REQUIRE_FALSE(hoard::vector::VectorStoreConfig::from_env({}).has_value());

    unset_env_var("HOARD_VECTOR_BACKEND");
    unset_env_var("HOARD_REDIS_HOST");
    unset_env_var("HOARD_REDIS_PORT");
    auto defaults = hoard::vector::VectorStoreConfig::from_env({});
    REQUIRE(defaults.has_value());
    REQUIRE(defaults->backend == hoard::vector::VectorStoreConfig::Backend::local);
    REQUIRE(defaults->batch_size == 200);
}

TEST_CASE("retrieval parameters from the environment", "[platform][env][config]") {
    set_env_var("HOARD_RETRIEVAL_MULTIPLIER", "3");
    auto p = hoard::retrieval::RetrievalParams::from_env();
    REQUIRE(p.has_value());
    REQUIRE(p->retrieval_multiplier == 3u);
    REQUIRE(p->nlist == 50u);
    unset_env_var("HOARD_RETRIEVAL_MULTIPLIER");
}
