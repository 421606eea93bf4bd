#include "DeleteBonesDialog.h"

#include <maya/MQtUtil.h>

static QString utf8ToQString(const std::string& s) {
    return QString::fromUtf8(s.c_str(), static_cast<int>(s.size()));
}

bool DeleteBonesDialog::ask(const std::string& text, bool& duplicate)
{
    QWidget* mayaMainWindow = MQtUtil::mainWindow();
    DeleteBonesDialog dlg(text, duplicate, mayaMainWindow);
    if (dlg.exec() != QDialog::Accepted) return false;
    duplicate = dlg.duplicateSkeleton();
    return true;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

DeleteBonesDialog::DeleteBonesDialog(const std::string& text, bool duplicate, QWidget* parent)
    : QDialog(parent)
    , messageLabel_(nullptr)
    , duplicateCheck_(nullptr)
{
    setupUI(text, duplicate);
}

DeleteBonesDialog::~DeleteBonesDialog() {}

bool DeleteBonesDialog::duplicateSkeleton() const
{
    return duplicateCheck_->isChecked();
}

// ============================================================================
// setupUI
// ============================================================================

void DeleteBonesDialog::setupUI(const std::string& text, bool duplicate)
{
    setWindowTitle("Delete Unused Bones");
    setMinimumWidth(380);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 4);
    mainLayout->setSpacing(6);

    // ----- Message -----
    {
        messageLabel_ = new QLabel(utf8ToQString(text));
        messageLabel_->setWordWrap(true);
        QFont boldFont = messageLabel_->font();
        boldFont.setBold(true);
        messageLabel_->setFont(boldFont);
        mainLayout->addWidget(messageLabel_);
    }

    // ----- Option -----
    {
        duplicateCheck_ = new QCheckBox("Duplicate Armature");
        duplicateCheck_->setChecked(duplicate);
        duplicateCheck_->setToolTip(
            "Copy the skeleton, move the mesh onto the copy and prune only the copy.\n"
            "The original skeleton is left untouched.");
        mainLayout->addWidget(duplicateCheck_);
    }

    // ----- Button row -----
    {
        QHBoxLayout* row = new QHBoxLayout();
        row->addStretch();

        QPushButton* okBtn = new QPushButton("OK");
        okBtn->setDefault(true);
        okBtn->setStyleSheet(
            "QPushButton { background-color: #996655; color: white; }");
        connect(okBtn, &QPushButton::clicked, this, &QDialog::accept);
        row->addWidget(okBtn);

        QPushButton* cancelBtn = new QPushButton("Cancel");
        connect(cancelBtn, &QPushButton::clicked, this, &QDialog::reject);
        row->addWidget(cancelBtn);

        mainLayout->addLayout(row);
    }
}
