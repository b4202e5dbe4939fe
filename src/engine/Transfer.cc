/*******************************************************************************
 * Copyright 2018 IBM Corp. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *  https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 *******************************************************************************/
#include "EngineIncludes.h"

/** @page transfer Transfer protocol

    Each artifact is processed by a single slot of the worker pool in
    the following way:

    -# The transfer record is set from pending (or failed_retryable)
       to in_progress by a conditional write. If another writer already
       changed the record the artifact is abandoned and counted as
       a conflict. Committed and failed_fatal artifacts are skipped.
    -# A token of the source bucket is acquired.
    -# The artifact is opened for reading at the source.
    -# A token of the target bucket is acquired and the content is
       streamed to the target. At the end of the content and before the
       target completes the write the content is validated against the
       declaration of the listing. A mismatch aborts the write and
       fails the artifact immediately.
    -# The checksum and size confirmed by the target are validated and
       the record is set to validated.
    -# The record is set to committed.

    Failures of steps 2 to 6 are classified by the RetryClassifier.
    Retryable failures are re-attempted starting with step 2 after the
    backoff delay until maxRetries re-attempts have been performed.
    Cancellation is checked between the steps, while waiting for a
    token and during the backoff delay. A cancelled artifact is set back
    to pending.
 */

std::string TransferOutcome::outcomeStr(outcome_t outcome)

{
    switch (outcome) {
        case COMMITTED:
            return "committed";
        case FAILED_RETRYABLE:
            return "failed_retryable";
        case FAILED_FATAL:
            return "failed_fatal";
        case SKIPPED:
            return "skipped";
        case CONFLICT:
            return "conflict";
        case REQUEUED:
            return "requeued";
        case ABORTED:
            return "aborted";
        default:
            return "";
    }
}

std::string Transfer::detailOf(const std::exception& e)

{
    const PkgMigException *pe = dynamic_cast<const PkgMigException*>(&e);
    std::string detail;

    if (pe == nullptr)
        return e.what();

    detail = pe->getContext();

    // "(a)(b)" -> "a: b"
    if (detail.size() > 1 && detail.front() == '(' && detail.back() == ')')
        detail = detail.substr(1, detail.size() - 2);
    size_t pos;
    while ((pos = detail.find(")(")) != std::string::npos)
        detail.replace(pos, 2, ": ");

    if (detail.size() == 0)
        detail = pe->what();

    return detail;
}

void Transfer::put(std::string identity, TransferRecord *record,
        TransferRecord::state_t toState, TransferRecord::state_t fromState)

{
    record->state = toState;
    store.putRecord(runId, identity, *record, fromState);

    TRACE(Trace::full, runId, identity,
            TransferRecord::stateStr(fromState),
            TransferRecord::stateStr(toState));
}

TransferOutcome Transfer::requeue(const Artifact& artifact,
        TransferRecord *record, TransferOutcome outcome)

{
    put(artifact.identity, record, TransferRecord::PENDING,
            TransferRecord::IN_PROGRESS);

    outcome.outcome = TransferOutcome::REQUEUED;
    outcome.attempts = record->attempts;

    TRACE(Trace::normal, runId, artifact.identity, record->attempts);

    return outcome;
}

/**
    Performs steps 2 to 6 of the transfer protocol. Returns false if
    the transfer has been cancelled. On success the computed checksum
    and the number of transferred bytes are set within the record.
 */
bool Transfer::transferData(const Artifact& artifact, TransferRecord *record)

{
    Artifact expected = artifact;
    Validator::result_t result;
    WriteConfirmation confirmation;
    long waited;

    if ((waited = limiter.acquire(Const::SOURCE_BUCKET, 1, &cancel)) == -1)
        return false;
    sink.count("wait." + Const::SOURCE_BUCKET, waited);

    SourceObject object = source.read(artifact.identity);

    if (object.content == nullptr) {
        TRACE(Trace::error, artifact.identity);
        THROW(Error::REMOTE_MALFORMED_REQUEST, artifact.identity);
    }

    if (expected.checksum.size() == 0)
        expected.checksum = object.checksum;
    if (expected.contentType.size() == 0)
        expected.contentType = object.contentType;

    if (cancel.isCancelled())
        return false;

    if ((waited = limiter.acquire(Const::TARGET_BUCKET, 1, &cancel)) == -1)
        return false;
    sink.count("wait." + Const::TARGET_BUCKET, waited);

    ValidatingReader content(*object.content, validator, artifact.identity,
            object.contentType, expected);

    confirmation = target.write(artifact.identity, content,
            expected.contentType, object.metadata);

    content.finish();

    // computed on first read if not declared
    if (expected.checksum.size() == 0)
        expected.checksum = content.getChecksum();

    result = validator.verifyDigest(artifact.identity, confirmation.checksum,
            confirmation.size, "", expected);

    if (!result.ok) {
        MSG(PKGMIGE0031E, artifact.identity, result.details);
        THROW(Error::INTEGRITY_MISMATCH, "target", result.details);
    }

    record->checksum = content.getChecksum();
    record->bytes = confirmation.size;

    return true;
}

TransferOutcome Transfer::execute(const Artifact& artifact)

{
    TransferOutcome outcome;
    TransferRecord record;
    TransferRecord::state_t prior = TransferRecord::PENDING;
    RetryClassifier::classification_t classification;
    int tries = 0;

    outcome.identity = artifact.identity;

    if (store.getRecord(runId, artifact.identity, &record))
        prior = record.state;
    else
        record = TransferRecord();

    outcome.prior = prior;
    outcome.attempts = record.attempts;

    if (TransferRecord::isTerminal(prior)) {
        TRACE(Trace::normal, runId, artifact.identity,
                TransferRecord::stateStr(prior));
        outcome.outcome = TransferOutcome::SKIPPED;
        outcome.bytes = record.bytes;
        return outcome;
    }

    if (prior == TransferRecord::IN_PROGRESS
            || prior == TransferRecord::VALIDATED) {
        TRACE(Trace::normal, runId, artifact.identity,
                TransferRecord::stateStr(prior));
        outcome.outcome = TransferOutcome::CONFLICT;
        return outcome;
    }

    if (cancel.isCancelled()) {
        outcome.outcome = TransferOutcome::REQUEUED;
        return outcome;
    }

    while (true) {
        tries++;
        record.attempts++;
        record.lastAttempt = time(NULL);

        try {
            put(artifact.identity, &record, TransferRecord::IN_PROGRESS,
                    tries == 1 ? prior : TransferRecord::IN_PROGRESS);
        } catch (const PkgMigException& e) {
            if (e.getError() != Error::CHECKPOINT_CONFLICT)
                throw;
            TRACE(Trace::normal, runId, artifact.identity, tries);
            sink.count("conflicts");
            outcome.outcome = TransferOutcome::CONFLICT;
            outcome.errorClass = RetryClassifier::errorClass(
                    Error::CHECKPOINT_CONFLICT);
            return outcome;
        }

        outcome.attempts = record.attempts;
        sink.count("attempts");

        try {
            if (transferData(artifact, &record) == false)
                return requeue(artifact, &record, outcome);
            break;
        } catch (const std::exception& e) {
            classification = classifier.classify(e, tries - 1);
            record.errorClass = classification.errorClass;
            record.errorDetail = detailOf(e);
            sink.count("failures." + classification.errorClass);

            TRACE(Trace::error, runId, artifact.identity, tries,
                    record.errorClass, e.what());

            if (classification.retryable == false) {
                put(artifact.identity, &record, TransferRecord::FAILED_FATAL,
                        TransferRecord::IN_PROGRESS);
                sink.event("failed_fatal", artifact.identity,
                        record.errorClass + ": " + record.errorDetail);
                outcome.outcome = TransferOutcome::FAILED_FATAL;
                outcome.errorClass = record.errorClass;
                outcome.errorDetail = record.errorDetail;
                outcome.halts = classification.halts;
                return outcome;
            }

            if (tries > classifier.getMaxRetries()) {
                put(artifact.identity, &record,
                        TransferRecord::FAILED_RETRYABLE,
                        TransferRecord::IN_PROGRESS);
                outcome.outcome = TransferOutcome::FAILED_RETRYABLE;
                outcome.errorClass = record.errorClass;
                outcome.errorDetail = record.errorDetail;
                return outcome;
            }

            if (cancel.sleep(classification.delay) == false)
                return requeue(artifact, &record, outcome);
        }
    }

    record.errorClass = "";
    record.errorDetail = "";
    put(artifact.identity, &record, TransferRecord::VALIDATED,
            TransferRecord::IN_PROGRESS);
    put(artifact.identity, &record, TransferRecord::COMMITTED,
            TransferRecord::VALIDATED);

    sink.count("successes");
    sink.event("committed", artifact.identity);

    outcome.outcome = TransferOutcome::COMMITTED;
    outcome.bytes = record.bytes;

    TRACE(Trace::normal, runId, artifact.identity, record.attempts,
            record.bytes);

    return outcome;
}
