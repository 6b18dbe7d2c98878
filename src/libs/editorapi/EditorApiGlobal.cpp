// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editorapi/EditorApiGlobal.hpp"

// doc: https://doc.qt.io/qt-6/qloggingcategory.html#creating-category-objects
Q_LOGGING_CATEGORY(editorapilog, "pulsar.editorapi")
