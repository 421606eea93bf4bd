#pragma once
#ifndef DELETEBONESDIALOG_H
#define DELETEBONESDIALOG_H

#include <QDialog>
#include <QCheckBox>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <QHBoxLayout>

#include <string>

// Modal confirmation shown before unused bones are deleted.
class DeleteBonesDialog : public QDialog {
    Q_OBJECT

public:
    DeleteBonesDialog(const std::string& text, bool duplicate, QWidget* parent = nullptr);
    ~DeleteBonesDialog() override;

    bool duplicateSkeleton() const;

    // Runs the dialog over Maya's main window. Returns false on Cancel;
    // duplicate receives the checkbox state on OK.
    static bool ask(const std::string& text, bool& duplicate);

private:
    void setupUI(const std::string& text, bool duplicate);

    QLabel* messageLabel_;
    QCheckBox* duplicateCheck_;
};

#endif // DELETEBONESDIALOG_H
