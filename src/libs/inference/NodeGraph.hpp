// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QPair>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <utility>
#include <variant>

namespace Inference {

// Output `slot` of the node called `node`; serialized as ["node", slot].
struct INFERENCE_EXPORT NodeReference final {
    QString node;
    int slot = 0;

    bool operator==(const NodeReference&) const = default;
};

using NodeInput = std::variant<std::monostate, bool, qint64, double, QString, NodeReference>;

INFERENCE_EXPORT QJsonValue nodeInputToJson(const NodeInput& input);

inline const NodeReference* asReference(const NodeInput& input)
{
    return std::get_if<NodeReference>(&input);
}

struct INFERENCE_EXPORT ComfyNode final {
    QString name;
    QString classType;
    QVector<QPair<QString, NodeInput>> inputs;

    ComfyNode() = default;
    ComfyNode(QString nodeName, QString nodeClass)
        : name(std::move(nodeName))
        , classType(std::move(nodeClass))
    {}

    // Replaces the value of an existing input in place, otherwise appends it.
    ComfyNode& set(const QString& key, NodeInput value);

    const NodeInput* input(const QString& key) const;
    bool hasInput(const QString& key) const { return input(key) != nullptr; }

    QJsonObject toJson() const;
};

// Insertion-ordered set of uniquely named nodes forming one backend prompt.
class INFERENCE_EXPORT NodeGraph final
{
public:
    // A node whose name is already present replaces the earlier node at its position.
    void add(ComfyNode node);
    bool remove(const QString& name);

    ComfyNode* find(const QString& name);
    const ComfyNode* find(const QString& name) const;
    bool contains(const QString& name) const { return m_index.contains(name); }

    int size() const noexcept { return m_nodes.size(); }
    bool isEmpty() const noexcept { return m_nodes.isEmpty(); }
    const QVector<ComfyNode>& nodes() const noexcept { return m_nodes; }
    QStringList names() const;

    // Reports every dangling reference, negative slot and cycle; an ok Result means the
    // graph can be submitted as is.
    Utils::Result validate() const;

    QJsonObject toJson() const;

private:
    void reindex();

    QVector<ComfyNode> m_nodes;
    QHash<QString, int> m_index;
};

} // namespace Inference
