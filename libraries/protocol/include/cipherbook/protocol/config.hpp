// see LICENSE.txt

#pragma once

#define CIPHERBOOK_ADDRESS_PREFIX                   "CBK"

#define CIPHERBOOK_MAX_NESTED_OBJECTS               (200)

/// Upper bounds on the opaque inputs accepted with a contribution
#define CIPHERBOOK_DEFAULT_MAX_CIPHERTEXT_SIZE      (16*1024)
#define CIPHERBOOK_DEFAULT_MAX_PROOF_SIZE           (1024)

#define CIPHERBOOK_DEFAULT_MODULUS_BITS             (2048)
#define CIPHERBOOK_MIN_MODULUS_BITS                 (256)

/// Domain separation tags for the digests computed by the reference engine
#define CIPHERBOOK_HANDLE_DIGEST_TAG                "cipherbook.handle.v1"
#define CIPHERBOOK_INPUT_DIGEST_TAG                 "cipherbook.input.v1"
