/*
 *  engine_plugin.h
 *  NarrateForge
 *
 *  Created by Till Toenshoff on 12/9/25.
 *  Copyright © 2025 Till Toenshoff. All rights reserved.
 *
 *  C ABI implemented by accelerated synthesis engines. An engine ships as a shared library
 *  named libnarrateforge_engine_<variant>.so (.dylib on macOS) and is loaded at runtime.
 */

#ifndef NARRATEFORGE_ENGINE_PLUGIN_H_
#define NARRATEFORGE_ENGINE_PLUGIN_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define NF_ENGINE_ABI_VERSION 2

/* Error codes */
#define NF_ENGINE_OK 0
#define NF_ENGINE_ERR_GENERIC -1
#define NF_ENGINE_ERR_INVALID_INPUT -2
#define NF_ENGINE_ERR_MODEL_LOAD_FAILED -3
#define NF_ENGINE_ERR_SYNTHESIS_FAILED -4
#define NF_ENGINE_ERR_UNAVAILABLE -5

/** @brief Opaque engine instance. */
typedef struct nf_engine nf_engine;

/** @brief Voice parameters for one synthesis call. */
typedef struct nf_engine_voice {
    const char *voice;         /**< Voice identifier, e.g. "af_heart". */
    float speed;               /**< Speech speed multiplier (1.0 = normal). */
    const char *split_pattern; /**< Regex the engine may use for internal splitting. */
} nf_engine_voice;

/** @brief Mono float audio owned by the engine, valid until the next call on that engine. */
typedef struct nf_engine_audio {
    const float *samples;
    size_t num_samples;
    uint32_t sample_rate;
} nf_engine_audio;

/** @brief Must return NF_ENGINE_ABI_VERSION the engine was built against. */
int nf_engine_abi_version(void);

/**
 * @brief Lightweight runtime check (device present, runtime usable). Must not load a model.
 * @return NF_ENGINE_OK when the engine can run on this machine.
 */
int nf_engine_probe(void);

/**
 * @brief Creates an engine instance and loads its model.
 * @param model_dir Directory holding model weights; may be NULL for the engine default.
 * @param lang_code Language code, e.g. "a" for American English.
 * @return Engine instance or NULL on failure.
 */
nf_engine *nf_engine_create(const char *model_dir, const char *lang_code);

/**
 * @brief Output sample rate of a created instance, fixed for its lifetime.
 * @return Rate in Hz. A rate of 0 makes the host reject the engine.
 */
uint32_t nf_engine_sample_rate(nf_engine *engine);

/** @brief Synthesizes one chunk of text into `out` at nf_engine_sample_rate(). */
int nf_engine_synthesize(nf_engine *engine, const char *text, const nf_engine_voice *voice,
                         nf_engine_audio *out);

/** @brief Human-readable description of the last failure on `engine` (never NULL). */
const char *nf_engine_last_error(nf_engine *engine);

/** @brief Releases the instance and everything it owns. */
void nf_engine_free(nf_engine *engine);

typedef int (*nf_engine_abi_version_fn)(void);
typedef int (*nf_engine_probe_fn)(void);
typedef nf_engine *(*nf_engine_create_fn)(const char *, const char *);
typedef uint32_t (*nf_engine_sample_rate_fn)(nf_engine *);
typedef int (*nf_engine_synthesize_fn)(nf_engine *, const char *, const nf_engine_voice *,
                                       nf_engine_audio *);
typedef const char *(*nf_engine_last_error_fn)(nf_engine *);
typedef void (*nf_engine_free_fn)(nf_engine *);

#ifdef __cplusplus
}
#endif

#endif  // NARRATEFORGE_ENGINE_PLUGIN_H_
