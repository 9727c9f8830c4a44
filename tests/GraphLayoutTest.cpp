#include <QtTest/QtTest>

#include "domain/GraphLayout.hpp"
#include "domain/JobGraph.hpp"

using et::mirror::domain::computeHierarchicalLayout;
using et::mirror::domain::ErrorKind;
using et::mirror::domain::JobGraph;
using et::mirror::domain::LayoutSettings;

class GraphLayoutTest : public QObject {
    Q_OBJECT

private slots:
    void chainLevels() {
        JobGraph g;
        g.addNode("A");
        g.addNode("B");
        g.addNode("C");
        g.addEdge("A", "B");
        g.addEdge("B", "C");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(res.ok);
        QCOMPARE(res.levels.at("A"), 0);
        QCOMPARE(res.levels.at("B"), 1);
        QCOMPARE(res.levels.at("C"), 2);
        QCOMPARE(res.layers.size(), std::size_t(3));
    }

    void longestPathWins() {
        // A -> B -> C and A -> C: C sits after B, not next to it.
        JobGraph g;
        g.addEdge("A", "C");
        g.addEdge("A", "B");
        g.addEdge("B", "C");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(res.ok);
        QCOMPARE(res.levels.at("C"), 2);
    }

    void levelsIncreaseAlongEveryEdge() {
        JobGraph g;
        g.addEdge("extract", "transform");
        g.addEdge("extract", "audit");
        g.addEdge("transform", "load");
        g.addEdge("audit", "load");
        g.addEdge("load", "report");
        g.addEdge("reference", "transform");
        g.addNode("standalone");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(res.ok);
        for (const auto& e : g.edges()) {
            QVERIFY2(res.levels.at(e.source) < res.levels.at(e.target),
                     qPrintable(QString::fromStdString(e.source + " -> " + e.target)));
        }
        QCOMPARE(res.levels.at("standalone"), 0);
        QCOMPARE(res.levels.size(), g.nodeCount());
    }

    void coordinates() {
        JobGraph g;
        g.addNode("A");
        g.addNode("B");
        g.addEdge("A", "C");
        g.addEdge("B", "C");

        LayoutSettings s;
        s.horizontalSpacing = 200.0;
        s.verticalSpacing = 100.0;

        const auto res = computeHierarchicalLayout(g, s);
        QVERIFY(res.ok);

        // Level 0 holds A then B: y = (i - 2/2 + 0.5) * 100.
        const std::vector<std::string> level0{"A", "B"};
        QCOMPARE(res.layers[0], level0);
        QCOMPARE(res.positions.at("A").x, 0.0);
        QCOMPARE(res.positions.at("A").y, -50.0);
        QCOMPARE(res.positions.at("B").y, 50.0);

        // A single node in its column is centred.
        QCOMPARE(res.positions.at("C").x, 200.0);
        QCOMPARE(res.positions.at("C").y, 0.0);
    }

    void columnsFollowNodeOrder() {
        // Q finishes before P because R (seen first) pulls Q in early.
        JobGraph g;
        g.addNode("R");
        g.addNode("P");
        g.addNode("Q");
        g.addNode("A");
        g.addEdge("A", "P");
        g.addEdge("A", "Q");
        g.addEdge("Q", "R");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(res.ok);

        const std::vector<std::string> level1{"P", "Q"};
        QCOMPARE(res.layers.at(1), level1);
        QCOMPARE(res.positions.at("P").y, -50.0);
        QCOMPARE(res.positions.at("Q").y, 50.0);

        const std::vector<std::string> level2{"R"};
        QCOMPARE(res.layers.at(2), level2);
    }

    void customSpacing() {
        JobGraph g;
        g.addEdge("A", "B");

        LayoutSettings s;
        s.horizontalSpacing = 50.0;
        s.verticalSpacing = 10.0;

        const auto res = computeHierarchicalLayout(g, s);
        QVERIFY(res.ok);
        QCOMPARE(res.positions.at("B").x, 50.0);
    }

    void twoNodeCycle() {
        JobGraph g;
        g.addEdge("A", "B");
        g.addEdge("B", "A");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(!res.ok);
        QCOMPARE(res.error.kind, ErrorKind::CyclicGraph);
        QVERIFY2(res.error.message.find("A -> B -> A") != std::string::npos, res.error.message.c_str());
    }

    void selfLoopIsCycle() {
        JobGraph g;
        g.addEdge("A", "A");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(!res.ok);
        QCOMPARE(res.error.kind, ErrorKind::CyclicGraph);
        QVERIFY(res.error.message.find("A -> A") != std::string::npos);
    }

    void cycleBehindAcyclicPrefix() {
        JobGraph g;
        g.addEdge("root", "X");
        g.addEdge("X", "Y");
        g.addEdge("Y", "Z");
        g.addEdge("Z", "X");

        const auto res = computeHierarchicalLayout(g);
        QVERIFY(!res.ok);
        QCOMPARE(res.error.kind, ErrorKind::CyclicGraph);
    }

    void emptyGraph() {
        const auto res = computeHierarchicalLayout(JobGraph{});
        QVERIFY(res.ok);
        QVERIFY(res.levels.empty());
        QVERIFY(res.positions.empty());
        QVERIFY(res.layers.empty());
    }

    void deepChainDoesNotRecurse() {
        JobGraph g;
        const int depth = 20000;
        for (int i = 0; i < depth; ++i) {
            g.addEdge("n" + std::to_string(i), "n" + std::to_string(i + 1));
        }

        // Walk from the deepest node first so the traversal has to descend.
        JobGraph reversed;
        for (int i = depth; i >= 0; --i) {
            reversed.addNode("n" + std::to_string(i));
        }
        for (const auto& e : g.edges()) {
            reversed.addEdge(e.source, e.target);
        }

        const auto res = computeHierarchicalLayout(reversed);
        QVERIFY(res.ok);
        QCOMPARE(res.levels.at("n" + std::to_string(depth)), depth);
    }
};

QTEST_GUILESS_MAIN(GraphLayoutTest)
#include "GraphLayoutTest.moc"
