/*
 * The entry point into the python _txsync module exposing the reconciliation engine to a Python host.
 */
#include <txsync/python/txsync_nanobind.h>

void export_utils(nb::module_ &);

void export_runtime(nb::module_ &);

void export_polling(nb::module_ &);

void export_transaction(nb::module_ &);

NB_MODULE(_txsync, m) {
    m.doc() = "The txsync write/read reconciliation engine";

    export_utils(m);
    export_runtime(m);
    export_polling(m);
    export_transaction(m);
}
