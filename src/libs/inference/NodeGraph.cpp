// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/NodeGraph.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QQueue>

#include <algorithm>

namespace Inference {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

QJsonValue nodeInputToJson(const NodeInput& input)
{
    return std::visit(Overloaded{
                          [](std::monostate) { return QJsonValue(QJsonValue::Null); },
                          [](bool v) { return QJsonValue(v); },
                          [](qint64 v) { return QJsonValue(v); },
                          [](double v) { return QJsonValue(v); },
                          [](const QString& v) { return QJsonValue(v); },
                          [](const NodeReference& ref) {
                              return QJsonValue(QJsonArray{ref.node, ref.slot});
                          },
                      },
                      input);
}

ComfyNode& ComfyNode::set(const QString& key, NodeInput value)
{
    for (auto& entry : inputs) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return *this;
        }
    }
    inputs.push_back({key, std::move(value)});
    return *this;
}

const NodeInput* ComfyNode::input(const QString& key) const
{
    for (const auto& entry : inputs) {
        if (entry.first == key)
            return &entry.second;
    }
    return nullptr;
}

QJsonObject ComfyNode::toJson() const
{
    QJsonObject in;
    for (const auto& [key, value] : inputs)
        in.insert(key, nodeInputToJson(value));

    return QJsonObject{
        {QStringLiteral("class_type"), classType},
        {QStringLiteral("inputs"), in},
    };
}

void NodeGraph::add(ComfyNode node)
{
    const auto it = m_index.constFind(node.name);
    if (it != m_index.cend()) {
        m_nodes[it.value()] = std::move(node);
        return;
    }
    m_index.insert(node.name, m_nodes.size());
    m_nodes.push_back(std::move(node));
}

bool NodeGraph::remove(const QString& name)
{
    const auto it = m_index.constFind(name);
    if (it == m_index.cend())
        return false;
    m_nodes.removeAt(it.value());
    reindex();
    return true;
}

ComfyNode* NodeGraph::find(const QString& name)
{
    const auto it = m_index.constFind(name);
    return it == m_index.cend() ? nullptr : &m_nodes[it.value()];
}

const ComfyNode* NodeGraph::find(const QString& name) const
{
    const auto it = m_index.constFind(name);
    return it == m_index.cend() ? nullptr : &m_nodes.at(it.value());
}

QStringList NodeGraph::names() const
{
    QStringList out;
    out.reserve(m_nodes.size());
    for (const ComfyNode& node : m_nodes)
        out.push_back(node.name);
    return out;
}

Utils::Result NodeGraph::validate() const
{
    Utils::Result result;

    // Kahn's algorithm over edges producer -> consumer.
    QVector<int> inDegree(m_nodes.size(), 0);
    QVector<QVector<int>> consumers(m_nodes.size());

    for (int i = 0; i < m_nodes.size(); ++i) {
        const ComfyNode& node = m_nodes[i];
        for (const auto& [key, value] : node.inputs) {
            const NodeReference* ref = asReference(value);
            if (!ref)
                continue;

            if (ref->slot < 0) {
                result.addError(QStringLiteral("Input '%1' of node '%2' uses negative output slot %3.")
                                    .arg(key, node.name)
                                    .arg(ref->slot));
            }

            const auto producer = m_index.constFind(ref->node);
            if (producer == m_index.cend()) {
                result.addError(QStringLiteral("Input '%1' of node '%2' references missing node '%3'.")
                                    .arg(key, node.name, ref->node));
                continue;
            }

            consumers[producer.value()].push_back(i);
            ++inDegree[i];
        }
    }

    QQueue<int> ready;
    for (int i = 0; i < inDegree.size(); ++i) {
        if (inDegree[i] == 0)
            ready.enqueue(i);
    }

    int visited = 0;
    while (!ready.isEmpty()) {
        const int current = ready.dequeue();
        ++visited;
        for (const int consumer : std::as_const(consumers[current])) {
            if (--inDegree[consumer] == 0)
                ready.enqueue(consumer);
        }
    }

    if (visited != m_nodes.size()) {
        QStringList cyclic;
        for (int i = 0; i < inDegree.size(); ++i) {
            if (inDegree[i] > 0)
                cyclic.push_back(m_nodes[i].name);
        }
        result.addError(QStringLiteral("Graph contains a cycle through: %1").arg(cyclic.join(QStringLiteral(", "))));
    }

    return result;
}

QJsonObject NodeGraph::toJson() const
{
    QJsonObject out;
    for (const ComfyNode& node : m_nodes)
        out.insert(node.name, node.toJson());
    return out;
}

void NodeGraph::reindex()
{
    m_index.clear();
    for (int i = 0; i < m_nodes.size(); ++i)
        m_index.insert(m_nodes[i].name, i);
}

} // namespace Inference
